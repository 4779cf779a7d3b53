//
// Created by cv2 on 09.10.2026.
//

#pragma once
#include <thread>
#include <atomic>
#include <filesystem>

#include "../common/channel.hpp"

namespace perch {

    class UploadQueue;
    class OperatorLog;

    // Producer side of the pipeline: paths from the watcher -> UploadQueue::add
    class Ingestor {
    public:
        Ingestor(Channel<std::filesystem::path>& in, UploadQueue& queue, OperatorLog& log);
        ~Ingestor();

        void start();
        void stop();

        bool running() const { return thread_.joinable(); }

        // Handle a single path synchronously; returns true if it was queued
        bool ingest(const std::filesystem::path& path);

    private:
        void loop(std::stop_token stop);

        Channel<std::filesystem::path>& in_;
        UploadQueue& queue_;
        OperatorLog& log_;

        std::jthread thread_;
    };

} // namespace perch
