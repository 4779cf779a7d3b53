//
// Created by cv2 on 06.10.2026.
//

#include "config.hpp"
#include <fstream>
#include <sstream>
#include <print>
#include <cstdint>

namespace perch {

const char* config_error_name(ConfigError e) {
    switch (e) {
        case ConfigError::ReadFailed: return "config file could not be read";
        case ConfigError::ParseFailed: return "config file is not valid JSON";
        case ConfigError::InvalidValue: return "config file has a value of the wrong type";
    }
    return "unknown";
}

namespace {
    // Counts are stored as size_t; a negative value is read as 0 so validate() rejects it
    size_t count_value(const json& j, const char* key, size_t fallback) {
        if (!j.contains(key)) return fallback;
        int64_t n = j.at(key).get<int64_t>();
        return n < 0 ? 0 : static_cast<size_t>(n);
    }
}

Config config_from_json(const json& j) {
    Config c;
    c.api_endpoint = j.value("api_endpoint", "");
    c.api_key = j.value("api_key", "");
    c.event_code = j.value("event_code", "");

    // Older files store null when no folder was picked
    if (j.contains("watch_folder") && j["watch_folder"].is_string()) {
        c.watch_folder = j["watch_folder"].get<std::string>();
    }

    c.max_concurrent_uploads = count_value(j, "max_concurrent_uploads", c.max_concurrent_uploads);
    c.tick_interval_ms = j.value("tick_interval_ms", c.tick_interval_ms);
    c.worker_threads = count_value(j, "worker_threads", c.worker_threads);
    c.control_endpoint = j.value("control_endpoint", c.control_endpoint);
    c.notifications = j.value("notifications", c.notifications);
    return c;
}

json config_to_json(const Config& c) {
    json j;
    j["api_endpoint"] = c.api_endpoint;
    j["api_key"] = c.api_key;
    j["event_code"] = c.event_code;
    if (c.watch_folder.empty()) {
        j["watch_folder"] = nullptr;
    } else {
        j["watch_folder"] = c.watch_folder;
    }
    j["max_concurrent_uploads"] = c.max_concurrent_uploads;
    j["tick_interval_ms"] = c.tick_interval_ms;
    j["worker_threads"] = c.worker_threads;
    j["control_endpoint"] = c.control_endpoint;
    j["notifications"] = c.notifications;
    return j;
}

std::expected<Config, ConfigError> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return Config{};

    std::ifstream in(path);
    if (!in) return std::unexpected(ConfigError::ReadFailed);

    std::stringstream buffer;
    buffer << in.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::unexpected(ConfigError::ParseFailed);

    try {
        return config_from_json(j);
    } catch (const json::exception& e) {
        std::println(stderr, "[Config] {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }
}

bool save_config(const Config& config, const std::filesystem::path& path) {
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return false;
        out << config_to_json(config).dump(2) << '\n';
        if (!out) return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::println(stderr, "[Config] Failed to save {}: {}", path.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

std::expected<void, std::string> validate(const Config& c) {
    if (c.api_endpoint.empty()) return std::unexpected("API endpoint is not configured");
    if (c.api_key.empty()) return std::unexpected("API key is not configured");
    if (c.event_code.empty()) return std::unexpected("Event code is not configured");
    if (c.watch_folder.empty()) return std::unexpected("No folder selected to watch");
    if (c.max_concurrent_uploads == 0) return std::unexpected("max_concurrent_uploads must be at least 1");
    if (c.tick_interval_ms <= 0) return std::unexpected("tick_interval_ms must be positive");
    if (c.worker_threads == 0) return std::unexpected("worker_threads must be at least 1");
    return {};
}

} // namespace perch
