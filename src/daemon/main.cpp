#include <string>
#include <string_view>
#include <optional>
#include <memory>
#include <print>
#include <format>
#include <filesystem>
#include <condition_variable>
#include <mutex>
#include <atomic>
#include <chrono>
#include <csignal>
#include <charconv>

// Third-party
#include <nlohmann/json.hpp>

// Internal Modules
#include "../common/config.hpp"
#include "../common/log.hpp"
#include "../common/channel.hpp"
#include "../common/worker_pool.hpp"
#include "../common/notifier.hpp"
#include "gallery_client.hpp"
#include "upload_queue.hpp"
#include "upload_manager.hpp"
#include "file_watcher.hpp"
#include "ingestor.hpp"
#include "ipc_server.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

// --- Command line ---

struct Args {
    fs::path config_path = "config.json";
    std::optional<std::string> folder;
    std::optional<std::string> endpoint;
    std::optional<std::string> key;
    std::optional<std::string> event;
    std::optional<size_t> max_uploads;
    bool save_config = false;
    bool check = false;
    bool no_notify = false;
    bool help = false;
};

static void print_usage() {
    std::println("Usage: perchd [options]");
    std::println("  --config <path>      configuration file (default: config.json)");
    std::println("  --folder <dir>       folder to watch for new photos");
    std::println("  --endpoint <url>     gallery API base URL");
    std::println("  --key <api key>      gallery API key");
    std::println("  --event <code>       event code uploads are sent to");
    std::println("  --max-uploads <n>    concurrent upload ceiling");
    std::println("  --save-config        write the merged configuration back to the file");
    std::println("  --check              test the connection to the gallery and exit");
    std::println("  --no-notify          disable desktop notifications");
    std::println("  --help               show this message");
}

static std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::println(stderr, "[Main] {} needs a value", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") args.help = true;
        else if (arg == "--save-config") args.save_config = true;
        else if (arg == "--check") args.check = true;
        else if (arg == "--no-notify") args.no_notify = true;
        else if (arg == "--config") { auto v = value(); if (!v) return std::nullopt; args.config_path = *v; }
        else if (arg == "--folder") { if (!(args.folder = value())) return std::nullopt; }
        else if (arg == "--endpoint") { if (!(args.endpoint = value())) return std::nullopt; }
        else if (arg == "--key") { if (!(args.key = value())) return std::nullopt; }
        else if (arg == "--event") { if (!(args.event = value())) return std::nullopt; }
        else if (arg == "--max-uploads") {
            auto v = value();
            if (!v) return std::nullopt;
            size_t n = 0;
            auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
            if (ec != std::errc() || ptr != v->data() + v->size() || n == 0) {
                std::println(stderr, "[Main] --max-uploads expects a positive number, got '{}'", *v);
                return std::nullopt;
            }
            args.max_uploads = n;
        }
        else {
            std::println(stderr, "[Main] Unknown option: {}", arg);
            return std::nullopt;
        }
    }
    return args;
}

static void apply_overrides(perch::Config& config, const Args& args) {
    if (args.folder) config.watch_folder = *args.folder;
    if (args.endpoint) config.api_endpoint = *args.endpoint;
    if (args.key) config.api_key = *args.key;
    if (args.event) config.event_code = *args.event;
    if (args.max_uploads) config.max_concurrent_uploads = *args.max_uploads;
    if (args.no_notify) config.notifications = false;
}

// --- Shutdown signalling ---

std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;
bool shutdown_requested = false;
std::atomic<bool> signal_received{false};

extern "C" void on_signal(int) {
    signal_received = true;
}

static void request_shutdown() {
    std::lock_guard lock(shutdown_mutex);
    shutdown_requested = true;
    shutdown_cv.notify_all();
}

static int run_check(const perch::Config& config) {
    if (config.api_endpoint.empty() || config.api_key.empty()) {
        std::println(stderr, "[Main] --check needs api_endpoint and api_key");
        return 1;
    }

    perch::GalleryClient client(config.api_endpoint);
    std::println("[Main] Testing connection to {}", client.base_url());

    auto health = client.health_check(config.api_key);
    if (!health) {
        std::println(stderr, "[Main] Connection failed: {}", perch::describe(health.error()));
        return 1;
    }
    std::println("[Main] Connection OK: {} ({})", health->message, health->timestamp);
    return 0;
}

// --- Main ---

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    if (args->help) {
        print_usage();
        return 0;
    }

    auto loaded = perch::load_config(args->config_path);
    if (!loaded) {
        std::println(stderr, "[Main] Cannot load {}: {}", args->config_path.string(),
                     perch::config_error_name(loaded.error()));
        return 1;
    }
    perch::Config config = *loaded;
    apply_overrides(config, *args);

    if (args->save_config) {
        if (!perch::save_config(config, args->config_path)) {
            std::println(stderr, "[Main] Failed to save configuration to {}", args->config_path.string());
            return 1;
        }
        std::println("[Main] Configuration saved to {}", args->config_path.string());
    }

    if (args->check) return run_check(config);

    if (auto valid = perch::validate(config); !valid) {
        std::println(stderr, "[Main] Invalid configuration: {}", valid.error());
        return 1;
    }

    std::println("=========================================");
    std::println("        PERCH UPLOAD DAEMON              ");
    std::println("=========================================");

    // 1. Core services
    perch::OperatorLog log;
    perch::WorkerPool pool(config.worker_threads, &log);
    auto transport = std::make_shared<perch::GalleryClient>(config.api_endpoint);
    perch::UploadQueue queue(&log);

    perch::ManagerOptions options;
    options.watch_folder = fs::absolute(config.watch_folder).lexically_normal();
    options.api_key = config.api_key;
    options.event_code = config.event_code;
    options.max_concurrent_uploads = config.max_concurrent_uploads;
    options.tick_interval = std::chrono::milliseconds(config.tick_interval_ms);

    perch::UploadManager manager(queue, transport, pool, log, options);
    perch::Notifier notifier("Perch", config.notifications);

    // 2. Control socket
    perch::IPCServer ipc(config.control_endpoint, queue, manager, transport, pool, log, config.api_key);
    ipc.on_quit = [] { request_shutdown(); };

    log.set_subscriber([&ipc](const perch::LogLine& line) {
        ipc.broadcast_event("log", json{
            {"level", perch::level_name(line.level)}, {"tag", line.tag}, {"text", line.text}
        });
    });

    manager.set_on_finished([&ipc, &notifier](const perch::UploadItem& item) {
        ipc.broadcast_event("item_finished", perch::item_to_json(item));
        if (item.is_completed()) {
            notifier.notify("Upload complete", item.display_name());
        } else {
            notifier.notify("Upload failed", std::format("{}: {}", item.display_name(), item.error()),
                            perch::Urgency::Critical);
        }
    });

    // The hooks point at ipc and notifier, which are destroyed before manager and log
    auto detach_hooks = [&] {
        manager.set_on_finished({});
        log.set_subscriber({});
    };

    if (auto started = ipc.start(); !started) {
        detach_hooks();
        std::println(stderr, "[Main] {}", started.error());
        return 1;
    }

    // 3. Pipeline: watcher -> ingestor -> queue -> manager
    if (auto started = manager.start(); !started) {
        detach_hooks();
        std::println(stderr, "[Main] {}", started.error().message);
        return 1;
    }

    perch::Channel<fs::path> detected;
    auto watcher = perch::FileWatcher::open(options.watch_folder, detected, log);
    if (!watcher) {
        manager.stop();
        detach_hooks();
        std::println(stderr, "[Main] {}", watcher.error().message);
        return 1;
    }

    perch::Ingestor ingestor(detected, queue, log);
    ingestor.start();

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    log.info("Main", "Daemon running. Watching {}", options.watch_folder.string());

    // 4. Wait for quit or a signal
    {
        std::unique_lock lock(shutdown_mutex);
        while (!shutdown_requested && !signal_received) {
            shutdown_cv.wait_for(lock, std::chrono::milliseconds(200));
        }
    }

    log.info("Main", "Shutting down...");

    (*watcher)->close();
    detected.close();
    ingestor.stop();
    manager.stop();
    manager.wait_idle();
    pool.shutdown();

    detach_hooks();
    ipc.stop();

    std::println("[Main] Bye.");
    return 0;
}
