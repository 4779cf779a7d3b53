//
// Created by cv2 on 04.10.2026.
//

#pragma once
#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

namespace perch {

    // Unbounded multi-producer / multi-consumer queue.
    // Once closed, send() drops values and receivers drain what is left,
    // then get std::nullopt.
    template <typename T>
    class Channel {
    public:
        Channel() = default;
        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;

        // Returns false if the channel is closed
        bool send(T value) {
            {
                std::lock_guard lock(mutex_);
                if (closed_) return false;
                queue_.push(std::move(value));
            }
            cv_.notify_one();
            return true;
        }

        std::optional<T> receive() {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            return pop_locked();
        }

        template <typename Rep, typename Period>
        std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
            return pop_locked();
        }

        std::optional<T> try_receive() {
            std::lock_guard lock(mutex_);
            return pop_locked();
        }

        void close() {
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const {
            std::lock_guard lock(mutex_);
            return closed_;
        }

        size_t size() const {
            std::lock_guard lock(mutex_);
            return queue_.size();
        }

    private:
        std::optional<T> pop_locked() {
            if (queue_.empty()) return std::nullopt;
            T value = std::move(queue_.front());
            queue_.pop();
            return value;
        }

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::queue<T> queue_;
        bool closed_ = false;
    };

} // namespace perch
