//
// Created by cv2 on 10.10.2026.
//

#pragma once
#include <string>
#include <cstdint>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <memory>
#include <optional>
#include <expected>
#include <chrono>
#include <filesystem>

#include "upload_item.hpp"
#include "upload_transport.hpp"

namespace perch {

    class UploadQueue;
    class WorkerPool;
    class OperatorLog;

    struct DestinationSnapshot {
        std::string value;
        uint64_t version = 0;
    };

    // The event code uploads are sent to. Many tasks read it, configuration
    // changes write it; every write bumps the version.
    class DestinationContext {
    public:
        explicit DestinationContext(std::string initial);

        DestinationSnapshot snapshot() const;

        // Returns the previous value if it changed, nullopt if identical
        std::optional<std::string> update(const std::string& value);

    private:
        mutable std::shared_mutex mutex_;
        std::string value_;
        uint64_t version_ = 1;
    };

    struct ManagerOptions {
        std::filesystem::path watch_folder;
        std::string api_key;
        std::string event_code;
        size_t max_concurrent_uploads = 3;
        std::chrono::milliseconds tick_interval{1000};
    };

    struct ManagerError {
        enum class Code {
            OutputDirFailed
        };

        Code code;
        std::string message;
    };

    // Scheduler: every tick claims at most one queued item and runs its upload
    // on the worker pool. Successful files are moved to <watch_folder>/uploaded.
    class UploadManager {
    public:
        using FinishedCallback = std::function<void(const UploadItem&)>;

        UploadManager(UploadQueue& queue, std::shared_ptr<UploadTransport> transport,
                      WorkerPool& pool, OperatorLog& log, ManagerOptions options);

        // Stops the loop and waits for in-flight uploads
        ~UploadManager();

        UploadManager(const UploadManager&) = delete;
        UploadManager& operator=(const UploadManager&) = delete;

        // Creates the output directory and starts the tick loop. No-op if running.
        std::expected<void, ManagerError> start();

        // Stops the tick loop. Uploads already dispatched run to completion.
        void stop();

        bool is_running() const { return running_.load(); }

        // One scheduling pass. Returns true if an upload was dispatched.
        bool tick();

        // Returns true if the value changed
        bool update_destination(const std::string& event_code);
        DestinationSnapshot destination() const { return destination_.snapshot(); }

        size_t active_uploads() const { return active_.load(); }
        size_t max_concurrent_uploads() const { return options_.max_concurrent_uploads; }

        // Block until no upload task is in flight
        void wait_idle();

        const std::filesystem::path& watch_folder() const { return options_.watch_folder; }
        const std::filesystem::path& output_dir() const { return output_dir_; }

        // Invoked with a copy of the item once it is Completed or Failed
        void set_on_finished(FinishedCallback callback);

    private:
        struct UploadJob {
            ItemId id;
            std::filesystem::path source;
            std::string name;
            DestinationSnapshot destination;
        };

        void loop(std::stop_token stop);
        void run_upload(const UploadJob& job);
        // Returns the failure message, nullopt on success
        std::optional<std::string> attempt_upload(const UploadJob& job);
        void verify_checksum(const UploadJob& job, const UploadResponse& response);
        std::expected<std::filesystem::path, std::string> move_to_output(const std::filesystem::path& source);
        void finish(const UploadJob& job, std::optional<std::string> failure);

        UploadQueue& queue_;
        std::shared_ptr<UploadTransport> transport_;
        WorkerPool& pool_;
        OperatorLog& log_;
        ManagerOptions options_;
        std::filesystem::path output_dir_;

        DestinationContext destination_;

        std::atomic<bool> running_{false};
        std::mutex lifecycle_mutex_;
        std::jthread loop_thread_;
        std::mutex wake_mutex_;
        std::condition_variable_any wake_cv_;

        std::mutex tick_mutex_;
        std::atomic<size_t> active_{0};
        std::mutex idle_mutex_;
        std::condition_variable idle_cv_;

        std::mutex callback_mutex_;
        FinishedCallback on_finished_;
    };

} // namespace perch
