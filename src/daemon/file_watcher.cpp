//
// Created by cv2 on 09.10.2026.
//

#include "file_watcher.hpp"
#include "../common/log.hpp"

#include <sys/inotify.h>
#include <sys/eventfd.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <chrono>

namespace perch {

namespace {
    constexpr uint32_t kContentEvents = IN_CREATE | IN_MODIFY | IN_ATTRIB | IN_MOVED_TO;
    constexpr uint32_t kSelfEvents = IN_DELETE_SELF | IN_MOVE_SELF;
}

bool is_image_file(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) return false;
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "nef";
}

std::expected<std::unique_ptr<FileWatcher>, WatchError> FileWatcher::open(
    const std::filesystem::path& dir,
    Channel<std::filesystem::path>& out,
    OperatorLog& log
) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return std::unexpected(WatchError{WatchError::Code::NotFound,
                                          "Watch path does not exist: " + dir.string()});
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::unexpected(WatchError{WatchError::Code::NotADirectory,
                                          "Watch path is not a directory: " + dir.string()});
    }

    // Write probe. Only informative: a read-only folder can still be watched.
    {
        auto probe = dir / ".watcher_test";
        std::ofstream f(probe);
        if (f << "test") {
            f.close();
            std::filesystem::remove(probe, ec);
            log.info("Watcher", "Watch directory is writable: {}", dir.string());
        } else {
            log.warn("Watcher", "Watch directory may not be writable: {}", dir.string());
        }
    }

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(WatchError{WatchError::Code::SubscribeFailed,
                                          std::string("inotify_init1 failed: ") + std::strerror(errno)});
    }

    int wd = inotify_add_watch(fd, dir.c_str(), kContentEvents | kSelfEvents | IN_ONLYDIR);
    if (wd < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(WatchError{WatchError::Code::SubscribeFailed,
                                          "Cannot watch " + dir.string() + ": " + std::strerror(err)});
    }

    int wake = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(WatchError{WatchError::Code::SubscribeFailed,
                                          std::string("eventfd failed: ") + std::strerror(err)});
    }

    log.info("Watcher", "Started watching directory: {}", dir.string());
    return std::unique_ptr<FileWatcher>(new FileWatcher(dir, out, log, fd, wd, wake));
}

FileWatcher::FileWatcher(std::filesystem::path dir, Channel<std::filesystem::path>& out, OperatorLog& log,
                         int inotify_fd, int watch_descriptor, int wake_fd)
    : dir_(std::move(dir)), out_(out), log_(log),
      inotify_fd_(inotify_fd), watch_descriptor_(watch_descriptor), wake_fd_(wake_fd) {
    running_ = true;
    thread_ = std::jthread([this] { delivery_loop(); });
}

FileWatcher::~FileWatcher() { close(); }

void FileWatcher::close() {
    if (thread_.joinable()) {
        running_ = false;
        uint64_t one = 1;
        if (::write(wake_fd_, &one, sizeof(one)) < 0) {
            // Still exits on the next poll timeout
            log_.warn("Watcher", "Failed to signal delivery thread: {}", std::strerror(errno));
        }
        thread_.join();
    }

    if (inotify_fd_ >= 0) {
        if (watch_descriptor_ >= 0) inotify_rm_watch(inotify_fd_, watch_descriptor_);
        ::close(inotify_fd_);
        inotify_fd_ = -1;
        watch_descriptor_ = -1;
        log_.info("Watcher", "Stopped watching: {}", dir_.string());
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
}

void FileWatcher::delivery_loop() {
    log_.info("Watcher", "Event delivery thread started");

    alignas(struct inotify_event) char buffer[64 * 1024];

    while (running_) {
        pollfd fds[2] = {
            { inotify_fd_, POLLIN, 0 },
            { wake_fd_, POLLIN, 0 }
        };

        // running_ is re-checked at least every 500 ms
        int rc = ::poll(fds, 2, 500);
        if (rc < 0) {
            if (errno == EINTR) continue;
            log_.error("Watcher", "Watch error: poll failed: {}", std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        if (rc == 0) continue;
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            log_.error("Watcher", "Watch error: inotify descriptor reported an error");
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        if (fds[0].revents & POLLIN) {
            ssize_t n = ::read(inotify_fd_, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno != EAGAIN && errno != EINTR) report_read_error(errno);
                continue;
            }
            handle_events(buffer, static_cast<size_t>(n));
        }
    }

    log_.info("Watcher", "Event delivery thread stopped");
}

void FileWatcher::handle_events(const char* buffer, size_t length) {
    size_t offset = 0;
    while (offset + sizeof(struct inotify_event) <= length) {
        const auto* ev = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        offset += sizeof(struct inotify_event) + ev->len;

        if (ev->mask & IN_Q_OVERFLOW) {
            log_.warn("Watcher", "Event queue overflowed, some files may have been missed");
            continue;
        }
        if (ev->mask & kSelfEvents) {
            log_.error("Watcher", "Watch error: {} was moved or deleted", dir_.string());
            continue;
        }
        if (ev->mask & IN_IGNORED) {
            log_.warn("Watcher", "Watch on {} was removed by the kernel", dir_.string());
            continue;
        }

        if (!(ev->mask & kContentEvents) || ev->len == 0 || (ev->mask & IN_ISDIR)) continue;

        std::filesystem::path path = dir_ / ev->name;

        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec) && is_image_file(path)) {
            out_.send(std::move(path));
        }
    }
}

void FileWatcher::report_read_error(int err) {
    log_.error("Watcher", "Watch error: {}", std::strerror(err));
    if (err == EACCES || err == EPERM) {
        log_.error("Watcher", "This might be a permissions issue. Check the folder permissions.");
    } else if (err == ENOENT) {
        log_.error("Watcher", "The watched folder might have been moved or deleted.");
    }
}

} // namespace perch
