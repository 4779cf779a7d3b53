//
// Created by cv2 on 11.10.2026.
//

#pragma once
#include <string>
#include <vector>
#include <queue>
#include <set>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <expected>
#include <functional>
#include <zmq.hpp>
#include <nlohmann/json.hpp>

namespace perch {

    class UploadQueue;
    class UploadManager;
    class UploadTransport;
    class UploadItem;
    class WorkerPool;
    class OperatorLog;

    using json = nlohmann::json;

    // {"type": "event", "event": <type>, "payload": <payload>}
    json make_event(const std::string& type, const json& payload);

    json item_to_json(const UploadItem& item);

    // Control socket (ZeroMQ ROUTER). Clients send {"command", "payload"} and
    // receive events; broadcasts go to every client seen so far.
    class IPCServer {
    public:
        using Reply = std::function<void(json)>;

        IPCServer(std::string endpoint, UploadQueue& queue, UploadManager& manager,
                  std::shared_ptr<UploadTransport> transport, WorkerPool& pool,
                  OperatorLog& log, std::string api_key);
        ~IPCServer();

        IPCServer(const IPCServer&) = delete;
        IPCServer& operator=(const IPCServer&) = delete;

        // Binds synchronously so a taken port is reported to the caller
        std::expected<void, std::string> start();
        void stop();

        // Thread-safe; delivered by the socket thread on its next pass
        void broadcast_event(const std::string& type, const json& payload);

        // Executes one request. reply may be invoked later from a pool thread.
        void dispatch(const json& request, const Reply& reply);

        // Fired after "quit" was acknowledged
        std::function<void()> on_quit;

    private:
        struct Outgoing {
            std::string client; // empty = every known client
            std::string data;
        };

        void loop(std::stop_token stop);
        void receive(zmq::socket_t& socket);
        void flush(zmq::socket_t& socket);
        void enqueue(std::string client, const json& event);

        std::string endpoint_;
        UploadQueue& queue_;
        UploadManager& manager_;
        std::shared_ptr<UploadTransport> transport_;
        WorkerPool& pool_;
        OperatorLog& log_;
        std::string api_key_;

        zmq::context_t ctx_;
        std::unique_ptr<zmq::socket_t> socket_;
        std::jthread thread_;

        std::mutex queue_mutex_;
        std::queue<Outgoing> outgoing_;
        std::set<std::string> clients_; // socket thread only
    };

} // namespace perch
