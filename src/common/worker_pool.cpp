//
// Created by cv2 on 05.10.2026.
//

#include "worker_pool.hpp"
#include "log.hpp"
#include <print>
#include <exception>

namespace perch {

WorkerPool::WorkerPool(size_t threads, OperatorLog* log) : log_(log) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t WorkerPool::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && active_.load() == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();

    // Workers finish whatever is still queued before exiting
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

            if (tasks_.empty()) break; // stopping and drained

            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            if (log_) {
                log_->error("Pool", "Task threw: {}", e.what());
            } else {
                std::println(stderr, "[Pool] Task threw: {}", e.what());
            }
        }

        {
            std::lock_guard lock(mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace perch
