#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <fstream>
#include <print>
#include <chrono>
#include <charconv>
#include <zmq.hpp>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace perch {
    using json = nlohmann::json;
}

// --- IPC Client (talks to perchd) ---
class PerchClient {
public:
    explicit PerchClient(const std::string& endpoint) : ctx_(), sock_(ctx_, zmq::socket_type::dealer) {
        sock_.set(zmq::sockopt::linger, 0);
        sock_.connect(endpoint);
    }

    void send_command(const std::string& cmd, const perch::json& payload) {
        perch::json j;
        j["command"] = cmd;
        j["payload"] = payload;
        std::string s = j.dump();
        sock_.send(zmq::buffer(s), zmq::send_flags::none);
    }

    // First event that is not a broadcast, or nullopt on timeout
    std::optional<perch::json> wait_reply(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;

            zmq::pollitem_t items[] = { { static_cast<void*>(sock_), 0, ZMQ_POLLIN, 0 } };
            zmq::poll(items, 1, left);
            if (!(items[0].revents & ZMQ_POLLIN)) continue;

            zmq::message_t msg;
            if (!sock_.recv(msg, zmq::recv_flags::dontwait)) continue;

            auto j = perch::json::parse(msg.to_string(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) continue;

            std::string event = j.value("event", "");
            if (event == "log" || event == "item_finished") continue;
            return j;
        }
    }

private:
    zmq::context_t ctx_;
    zmq::socket_t sock_;
};

static void print_usage() {
    std::println("Usage: perchctl [--endpoint <zmq endpoint>] <command>");
    std::println("Commands:");
    std::println("  status                      daemon state");
    std::println("  stats                       queue counters");
    std::println("  list                        all tracked items");
    std::println("  clear completed|failed|all  drop items from the queue");
    std::println("  remove <id>                 drop one item");
    std::println("  event <code>                change the destination event code");
    std::println("  check                       test the connection to the gallery");
    std::println("  logs [n]                    recent daemon log lines");
    std::println("  thumb <id> <out.png>        save an item's thumbnail");
    std::println("  quit                        stop the daemon");
}

static std::optional<std::vector<unsigned char>> base64_decode(const std::string& in) {
    std::vector<unsigned char> out(3 * ((in.size() + 3) / 4));
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock counts '=' padding as zero bytes
    size_t pad = 0;
    if (!in.empty() && in.back() == '=') ++pad;
    if (in.size() > 1 && in[in.size() - 2] == '=') ++pad;
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

static std::string short_time(const perch::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return "-";
    return j[key].get<std::string>();
}

static int print_reply(const perch::json& reply, const std::vector<std::string>& args) {
    const std::string event = reply.value("event", "");
    const perch::json& p = reply.contains("payload") ? reply["payload"] : perch::json::object();

    if (event == "error") {
        std::println(stderr, "[perchctl] Error: {}", p.value("msg", "unknown"));
        return 1;
    }
    if (event == "status") {
        std::println("Running:       {}", p.value("running", false) ? "yes" : "no");
        std::println("Event code:    {}", p.value("event_code", ""));
        std::println("Watch folder:  {}", p.value("watch_folder", ""));
        std::println("Uploads:       {}/{}", p.value("active_uploads", 0), p.value("max_concurrent_uploads", 0));
    }
    else if (event == "stats") {
        std::println("Total: {}  Queued: {}  Uploading: {}  Completed: {}  Failed: {}",
                     p.value("total", 0), p.value("queued", 0), p.value("active", 0),
                     p.value("completed", 0), p.value("failed", 0));
    }
    else if (event == "items") {
        if (p.empty()) std::println("Queue is empty.");
        for (const auto& item : p) {
            std::println("{}  {:<10} {:>4.0f}%  {}  (added {}, done {})",
                         item.value("id", ""), item.value("status", ""),
                         item.value("progress", 0.0) * 100.0, item.value("name", ""),
                         short_time(item, "added_at"), short_time(item, "completed_at"));
            if (item.contains("error")) std::println("    {}", item.value("error", ""));
        }
    }
    else if (event == "thumbnail") {
        auto png = base64_decode(p.value("png_base64", ""));
        if (!png) {
            std::println(stderr, "[perchctl] Thumbnail data is not valid base64");
            return 1;
        }
        std::ofstream out(args[2], std::ios::binary);
        if (!out.write(reinterpret_cast<const char*>(png->data()), static_cast<std::streamsize>(png->size()))) {
            std::println(stderr, "[perchctl] Cannot write {}", args[2]);
            return 1;
        }
        std::println("Saved {}x{} thumbnail to {}", p.value("width", 0), p.value("height", 0), args[2]);
    }
    else if (event == "cleared") {
        std::println("Removed {} item(s).", p.value("removed", 0));
    }
    else if (event == "event_code_changed") {
        std::println("Event code changed: {} -> {}", p.value("old", ""), p.value("new", ""));
    }
    else if (event == "event_code_unchanged") {
        std::println("Event code unchanged: {}", p.value("event_code", ""));
    }
    else if (event == "connection") {
        bool ok = p.value("ok", false);
        std::println("{}: {}", ok ? "Connected" : "Not connected", p.value("message", ""));
        if (!ok) return 1;
    }
    else if (event == "logs") {
        for (const auto& line : p) {
            std::println("{} {:<7} [{}] {}", line.value("at", ""), line.value("level", ""),
                         line.value("tag", ""), line.value("text", ""));
        }
    }
    else if (event == "bye") {
        std::println("Daemon is shutting down.");
    }
    else {
        std::println("{}", reply.dump(2));
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string endpoint = "tcp://127.0.0.1:9102";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--endpoint" && i + 1 < argc) endpoint = argv[++i];
        else if (arg == "--help" || arg == "-h") { print_usage(); return 0; }
        else args.emplace_back(arg);
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& verb = args[0];
    std::string command;
    perch::json payload = perch::json::object();
    auto timeout = std::chrono::milliseconds(5000);

    if (verb == "status" && args.size() == 1) command = "get_status";
    else if (verb == "stats" && args.size() == 1) command = "get_stats";
    else if (verb == "list" && args.size() == 1) command = "list_items";
    else if (verb == "clear" && args.size() == 2 &&
             (args[1] == "completed" || args[1] == "failed" || args[1] == "all")) {
        command = "clear_" + args[1];
    }
    else if (verb == "remove" && args.size() == 2) {
        command = "remove_item";
        payload["id"] = args[1];
    }
    else if (verb == "event" && args.size() == 2) {
        command = "set_event_code";
        payload["event_code"] = args[1];
    }
    else if (verb == "check" && args.size() == 1) {
        command = "check_connection";
        timeout = std::chrono::milliseconds(60000);
    }
    else if (verb == "logs" && args.size() <= 2) {
        command = "get_logs";
        size_t limit = 50;
        if (args.size() == 2) {
            auto [ptr, ec] = std::from_chars(args[1].data(), args[1].data() + args[1].size(), limit);
            if (ec != std::errc() || ptr != args[1].data() + args[1].size()) {
                std::println(stderr, "[perchctl] logs expects a number, got '{}'", args[1]);
                return 1;
            }
        }
        payload["limit"] = limit;
    }
    else if (verb == "thumb" && args.size() == 3) {
        command = "get_thumbnail";
        payload["id"] = args[1];
    }
    else if (verb == "quit" && args.size() == 1) command = "quit";
    else {
        print_usage();
        return 1;
    }

    try {
        PerchClient client(endpoint);
        client.send_command(command, payload);

        auto reply = client.wait_reply(timeout);
        if (!reply) {
            std::println(stderr, "[perchctl] No answer from perchd at {}", endpoint);
            return 1;
        }
        return print_reply(*reply, args);
    } catch (const zmq::error_t& e) {
        std::println(stderr, "[perchctl] IPC error: {}", e.what());
        return 1;
    }
}
