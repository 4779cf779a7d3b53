//
// Created by cv2 on 05.10.2026.
//

#pragma once
#include <functional>
#include <deque>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace perch {

    class OperatorLog;

    // Fixed-size pool the upload tasks (and slow control commands) run on.
    class WorkerPool {
    public:
        explicit WorkerPool(size_t threads, OperatorLog* log = nullptr);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        // Returns false once the pool is shutting down
        bool submit(std::function<void()> task);

        size_t thread_count() const { return workers_.size(); }
        size_t pending() const;
        size_t active() const { return active_.load(); }

        // Block until no task is queued or running
        void wait_idle();

        // Drain the queue and join all workers. Called by the destructor.
        void shutdown();

    private:
        void worker_loop();

        OperatorLog* log_;

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::condition_variable idle_cv_;
        std::deque<std::function<void()>> tasks_;
        bool stopping_ = false;

        std::atomic<size_t> active_{0};
        std::vector<std::jthread> workers_;
    };

} // namespace perch
