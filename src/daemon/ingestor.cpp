//
// Created by cv2 on 09.10.2026.
//

#include "ingestor.hpp"
#include "upload_queue.hpp"
#include "../common/log.hpp"
#include <chrono>
#include <exception>

namespace perch {

Ingestor::Ingestor(Channel<std::filesystem::path>& in, UploadQueue& queue, OperatorLog& log)
    : in_(in), queue_(queue), log_(log) {}

Ingestor::~Ingestor() { stop(); }

void Ingestor::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token st) { loop(st); });
}

void Ingestor::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    thread_.join();
    thread_ = std::jthread();
}

bool Ingestor::ingest(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    log_.info("Ingest", "Detected new file: {}", name);

    if (auto id = queue_.add(path)) {
        log_.info("Ingest", "Added to upload queue: {} (ID: {}), queue size {}", name, *id, queue_.stats().total);
        return true;
    }

    log_.info("Ingest", "File already in queue: {}", name);
    return false;
}

void Ingestor::loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto path = in_.receive_for(std::chrono::milliseconds(200));
        if (!path) {
            if (in_.closed()) break;
            continue;
        }
        try {
            ingest(*path);
        } catch (const std::exception& e) {
            log_.error("Ingest", "Failed to ingest {}: {}", path->filename().string(), e.what());
        }
    }
}

} // namespace perch
