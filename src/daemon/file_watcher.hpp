//
// Created by cv2 on 09.10.2026.
//

#pragma once
#include <string>
#include <thread>
#include <atomic>
#include <memory>
#include <expected>
#include <filesystem>

#include "../common/channel.hpp"

namespace perch {

    class OperatorLog;

    struct WatchError {
        enum class Code {
            NotFound,
            NotADirectory,
            SubscribeFailed
        };

        Code code;
        std::string message;
    };

    // jpg, jpeg, png, nef - case-insensitive
    bool is_image_file(const std::filesystem::path& path);

    // Watches one directory (non-recursive) through inotify and pushes every
    // image path reported by a create/modify event onto `out`.
    // Repeated events for the same file are all forwarded; the queue dedups.
    class FileWatcher {
    public:
        static std::expected<std::unique_ptr<FileWatcher>, WatchError> open(
            const std::filesystem::path& dir,
            Channel<std::filesystem::path>& out,
            OperatorLog& log
        );

        ~FileWatcher();

        FileWatcher(const FileWatcher&) = delete;
        FileWatcher& operator=(const FileWatcher&) = delete;

        // Stops the delivery thread and releases the inotify descriptor.
        // Nothing is pushed onto the channel after this returns.
        void close();

        const std::filesystem::path& directory() const { return dir_; }
        bool running() const { return running_.load(); }

    private:
        FileWatcher(std::filesystem::path dir, Channel<std::filesystem::path>& out, OperatorLog& log,
                    int inotify_fd, int watch_descriptor, int wake_fd);

        void delivery_loop();
        void handle_events(const char* buffer, size_t length);
        void report_read_error(int err);

        std::filesystem::path dir_;
        Channel<std::filesystem::path>& out_;
        OperatorLog& log_;

        int inotify_fd_ = -1;
        int watch_descriptor_ = -1;
        int wake_fd_ = -1; // eventfd used to interrupt poll() on teardown

        std::atomic<bool> running_{false};
        std::jthread thread_;
    };

} // namespace perch
