//
// Created by cv2 on 11.10.2026.
//

#include "ipc_server.hpp"
#include "upload_queue.hpp"
#include "upload_manager.hpp"
#include "upload_transport.hpp"
#include "gallery_client.hpp"
#include "../common/worker_pool.hpp"
#include "../common/digest.hpp"
#include "../common/log.hpp"
#include <chrono>

namespace perch {

json make_event(const std::string& type, const json& payload) {
    json j;
    j["type"] = "event";
    j["event"] = type;
    j["payload"] = payload;
    return j;
}

json item_to_json(const UploadItem& item) {
    json j;
    j["id"] = item.id();
    j["name"] = item.display_name();
    j["path"] = item.source_path().string();
    j["status"] = status_name(item.status());
    if (item.is_failed()) j["error"] = item.error();
    j["progress"] = item.progress();
    j["added_at"] = rfc3339_utc(item.added_at());
    if (auto t = item.started_at()) j["started_at"] = rfc3339_utc(*t);
    if (auto t = item.completed_at()) j["completed_at"] = rfc3339_utc(*t);
    j["has_thumbnail"] = item.thumbnail().has_value();
    return j;
}

namespace {
    json error_event(const std::string& msg) {
        return make_event("error", json{{"msg", msg}});
    }

    json cleared_event(size_t removed) {
        return make_event("cleared", json{{"removed", removed}});
    }
}

IPCServer::IPCServer(std::string endpoint, UploadQueue& queue, UploadManager& manager,
                     std::shared_ptr<UploadTransport> transport, WorkerPool& pool,
                     OperatorLog& log, std::string api_key)
    : endpoint_(std::move(endpoint)),
      queue_(queue),
      manager_(manager),
      transport_(std::move(transport)),
      pool_(pool),
      log_(log),
      api_key_(std::move(api_key)) {}

IPCServer::~IPCServer() { stop(); }

std::expected<void, std::string> IPCServer::start() {
    if (thread_.joinable()) return {};

    try {
        auto socket = std::make_unique<zmq::socket_t>(ctx_, zmq::socket_type::router);
        socket->set(zmq::sockopt::linger, 200);
        socket->bind(endpoint_);
        socket_ = std::move(socket);
    } catch (const zmq::error_t& e) {
        return std::unexpected("Cannot bind " + endpoint_ + ": " + e.what());
    }

    log_.info("IPC", "Server listening (ROUTER) on {}", endpoint_);
    thread_ = std::jthread([this](std::stop_token st) { loop(st); });
    return {};
}

void IPCServer::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    thread_.join();
    thread_ = std::jthread();
    socket_.reset();
    ctx_.close();
}

void IPCServer::enqueue(std::string client, const json& event) {
    std::lock_guard lock(queue_mutex_);
    // File names are bytes on Linux; invalid UTF-8 becomes U+FFFD instead of throwing
    outgoing_.push(Outgoing{std::move(client), event.dump(-1, ' ', false, json::error_handler_t::replace)});
}

void IPCServer::broadcast_event(const std::string& type, const json& payload) {
    enqueue("", make_event(type, payload));
}

void IPCServer::loop(std::stop_token stop) {
    zmq::socket_t& socket = *socket_;
    try {
        while (!stop.stop_requested()) {
            zmq::pollitem_t items[] = {
                { static_cast<void*>(socket), 0, ZMQ_POLLIN, 0 }
            };
            zmq::poll(items, 1, std::chrono::milliseconds(20));

            if (items[0].revents & ZMQ_POLLIN) receive(socket);
            flush(socket);
        }
    } catch (const zmq::error_t& e) {
        log_.error("IPC", "Error: {}", e.what());
    }
}

void IPCServer::receive(zmq::socket_t& socket) {
    std::vector<zmq::message_t> frames;
    while (true) {
        zmq::message_t& frame = frames.emplace_back();
        if (!socket.recv(frame, zmq::recv_flags::dontwait)) {
            frames.pop_back();
            break;
        }
        if (!socket.get(zmq::sockopt::rcvmore)) break;
    }

    if (frames.size() < 2) {
        log_.warn("IPC", "Received packet with only {} frames", frames.size());
        return;
    }

    // Frame 0 is the identity added by ROUTER, the payload is the last frame
    std::string client(static_cast<const char*>(frames.front().data()), frames.front().size());
    clients_.insert(client);

    auto request = json::parse(frames.back().to_string(), nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        enqueue(client, error_event("Malformed request"));
        return;
    }

    try {
        dispatch(request, [this, client](json reply) { enqueue(client, reply); });
    } catch (const std::exception& e) {
        log_.error("IPC", "Command failed: {}", e.what());
        enqueue(client, error_event(std::string("Command failed: ") + e.what()));
    }
}

void IPCServer::flush(zmq::socket_t& socket) {
    std::queue<Outgoing> batch;
    {
        std::lock_guard lock(queue_mutex_);
        batch.swap(outgoing_);
    }

    while (!batch.empty()) {
        const Outgoing& out = batch.front();
        if (out.client.empty()) {
            for (const auto& client : clients_) {
                socket.send(zmq::buffer(client), zmq::send_flags::sndmore);
                socket.send(zmq::buffer(out.data), zmq::send_flags::dontwait);
            }
        } else {
            socket.send(zmq::buffer(out.client), zmq::send_flags::sndmore);
            socket.send(zmq::buffer(out.data), zmq::send_flags::dontwait);
        }
        batch.pop();
    }
}

void IPCServer::dispatch(const json& request, const Reply& reply) {
    if (!request.contains("command") || !request["command"].is_string()) {
        reply(error_event("Missing command"));
        return;
    }

    const std::string cmd = request["command"];
    const json payload = request.value("payload", json::object());

    auto string_field = [&](const char* key) -> std::string {
        if (!payload.is_object() || !payload.contains(key) || !payload[key].is_string()) return {};
        return payload[key].get<std::string>();
    };

    if (cmd == "get_status") {
        json info;
        info["running"] = manager_.is_running();
        info["event_code"] = manager_.destination().value;
        info["watch_folder"] = manager_.watch_folder().string();
        info["active_uploads"] = manager_.active_uploads();
        info["max_concurrent_uploads"] = manager_.max_concurrent_uploads();
        reply(make_event("status", info));
    }
    else if (cmd == "get_stats") {
        QueueStats s = queue_.stats();
        reply(make_event("stats", json{
            {"total", s.total}, {"queued", s.queued}, {"active", s.active},
            {"completed", s.completed}, {"failed", s.failed}
        }));
    }
    else if (cmd == "list_items") {
        json list = json::array();
        for (const auto& item : queue_.items()) list.push_back(item_to_json(item));
        reply(make_event("items", list));
    }
    else if (cmd == "get_thumbnail") {
        std::string id = string_field("id");
        if (id.empty()) {
            reply(error_event("get_thumbnail needs an id"));
            return;
        }
        auto thumb = queue_.thumbnail(id);
        if (!thumb) {
            reply(error_event("No thumbnail for " + id));
            return;
        }
        reply(make_event("thumbnail", json{
            {"id", id}, {"width", thumb->width}, {"height", thumb->height},
            {"png_base64", digest::base64_encode(thumb->png.data(), thumb->png.size())}
        }));
    }
    else if (cmd == "clear_completed") {
        reply(cleared_event(queue_.clear_completed()));
    }
    else if (cmd == "clear_failed") {
        reply(cleared_event(queue_.clear_failed()));
    }
    else if (cmd == "clear_all") {
        reply(cleared_event(queue_.clear_all()));
    }
    else if (cmd == "remove_item") {
        std::string id = string_field("id");
        if (id.empty()) {
            reply(error_event("remove_item needs an id"));
            return;
        }
        reply(cleared_event(queue_.remove(id)));
    }
    else if (cmd == "set_event_code") {
        std::string code = string_field("event_code");
        if (code.empty()) {
            reply(error_event("set_event_code needs a non-empty event_code"));
            return;
        }
        std::string old = manager_.destination().value;
        if (manager_.update_destination(code)) {
            reply(make_event("event_code_changed", json{{"old", old}, {"new", code}}));
        } else {
            reply(make_event("event_code_unchanged", json{{"event_code", code}}));
        }
    }
    else if (cmd == "check_connection") {
        // Blocking HTTP call, keep it off the socket thread
        bool queued = pool_.submit([this, reply] {
            auto health = transport_->health_check(api_key_);
            json info;
            if (health) {
                info["ok"] = health->success;
                info["message"] = health->message;
                info["timestamp"] = health->timestamp;
                log_.info("IPC", "Connection check: {}", health->message);
            } else {
                info["ok"] = false;
                info["message"] = describe(health.error());
                log_.warn("IPC", "Connection check failed: {}", describe(health.error()));
            }
            reply(make_event("connection", info));
        });
        if (!queued) reply(error_event("Daemon is shutting down"));
    }
    else if (cmd == "get_logs") {
        size_t limit = 0;
        if (payload.is_object() && payload.contains("limit") && payload["limit"].is_number_unsigned()) {
            limit = payload["limit"].get<size_t>();
        }
        json lines = json::array();
        for (const auto& line : log_.recent(limit)) {
            lines.push_back(json{
                {"level", level_name(line.level)}, {"tag", line.tag},
                {"text", line.text}, {"at", rfc3339_utc(line.at)}
            });
        }
        reply(make_event("logs", lines));
    }
    else if (cmd == "quit") {
        log_.info("IPC", "Quit requested");
        reply(make_event("bye", json::object()));
        if (on_quit) on_quit();
    }
    else {
        reply(error_event("Unknown command: " + cmd));
    }
}

} // namespace perch
