//
// Created by cv2 on 06.10.2026.
//

#pragma once
#include <string>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace perch {

    using json = nlohmann::json;

    struct Config {
        std::string api_endpoint;
        std::string api_key;
        std::string event_code;
        std::string watch_folder; // empty = not chosen yet

        // Tuning (optional in the file)
        size_t max_concurrent_uploads = 3;
        long tick_interval_ms = 1000;
        size_t worker_threads = 4;
        std::string control_endpoint = "tcp://127.0.0.1:9102";
        bool notifications = true;
    };

    enum class ConfigError {
        ReadFailed,
        ParseFailed,
        InvalidValue
    };

    const char* config_error_name(ConfigError e);

    Config config_from_json(const json& j);
    json config_to_json(const Config& config);

    // A missing file yields the defaults
    std::expected<Config, ConfigError> load_config(const std::filesystem::path& path);

    // Pretty-printed, written to "<path>.tmp" and renamed over the target
    bool save_config(const Config& config, const std::filesystem::path& path);

    // Everything the daemon needs before it can start watching
    std::expected<void, std::string> validate(const Config& config);

} // namespace perch
