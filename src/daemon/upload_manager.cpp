//
// Created by cv2 on 10.10.2026.
//

#include "upload_manager.hpp"
#include "upload_queue.hpp"
#include "../common/worker_pool.hpp"
#include "../common/digest.hpp"
#include "../common/log.hpp"
#include <format>
#include <algorithm>
#include <cctype>
#include <utility>
#include <exception>
#include <print>

namespace perch {

// --- DestinationContext ---

DestinationContext::DestinationContext(std::string initial) : value_(std::move(initial)) {}

DestinationSnapshot DestinationContext::snapshot() const {
    std::shared_lock lock(mutex_);
    return DestinationSnapshot{value_, version_};
}

std::optional<std::string> DestinationContext::update(const std::string& value) {
    std::unique_lock lock(mutex_);
    if (value_ == value) return std::nullopt;
    std::string old = std::exchange(value_, value);
    ++version_;
    return old;
}

// --- UploadManager ---

UploadManager::UploadManager(UploadQueue& queue, std::shared_ptr<UploadTransport> transport,
                             WorkerPool& pool, OperatorLog& log, ManagerOptions options)
    : queue_(queue),
      transport_(std::move(transport)),
      pool_(pool),
      log_(log),
      options_(std::move(options)),
      output_dir_(options_.watch_folder / "uploaded"),
      destination_(options_.event_code) {
    if (options_.max_concurrent_uploads == 0) options_.max_concurrent_uploads = 1;
}

UploadManager::~UploadManager() {
    stop();
    wait_idle();
}

std::expected<void, ManagerError> UploadManager::start() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (running_) return {};

    log_.info("Upload", "UploadManager starting...");
    log_.info("Upload", "Event code: {}", destination_.snapshot().value);
    log_.info("Upload", "API key: {}", redact_key(options_.api_key));
    log_.info("Upload", "Watch folder: {}", options_.watch_folder.string());

    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec || !std::filesystem::is_directory(output_dir_)) {
        std::string reason = ec ? ec.message() : "path exists and is not a directory";
        return std::unexpected(ManagerError{ManagerError::Code::OutputDirFailed,
                                            "Cannot create " + output_dir_.string() + ": " + reason});
    }

    running_ = true;
    loop_thread_ = std::jthread([this](std::stop_token st) { loop(st); });
    log_.info("Upload", "Upload manager started");
    return {};
}

void UploadManager::stop() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (!loop_thread_.joinable()) return;

    loop_thread_.request_stop();
    wake_cv_.notify_all();
    loop_thread_.join();
    loop_thread_ = std::jthread();
    running_ = false;

    log_.info("Upload", "Upload manager stopped");
}

void UploadManager::loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        tick();

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, options_.tick_interval, [] { return false; });
    }
}

bool UploadManager::tick() {
    std::lock_guard serial(tick_mutex_);

    if (active_.load() >= options_.max_concurrent_uploads) return false;

    UploadJob job;
    {
        auto access = queue_.lock();
        UploadItem* item = access.next_queued();
        if (!item) return false;

        // Claimed while the queue is still locked
        item->start_upload();
        job.id = item->id();
        job.source = item->source_path();
        job.name = item->display_name();
    }
    job.destination = destination_.snapshot();

    ++active_;
    log_.info("Upload", "Starting upload for: {}", job.name);

    if (!pool_.submit([this, job] { run_upload(job); })) {
        finish(job, "Upload failed: worker pool is shutting down");
    }
    return true;
}

void UploadManager::run_upload(const UploadJob& job) {
    std::optional<std::string> failure;
    try {
        failure = attempt_upload(job);
    } catch (const std::exception& e) {
        failure = std::string("Upload failed: ") + e.what();
    }
    finish(job, std::move(failure));
}

std::optional<std::string> UploadManager::attempt_upload(const UploadJob& job) {
    log_.info("Upload", "Attempting to upload: {} (event {})", job.source.string(), job.destination.value);

    auto response = transport_->upload(job.destination.value, job.source, options_.api_key);
    if (!response) return "Upload failed: " + describe(response.error());

    {
        auto access = queue_.lock();
        if (UploadItem* item = access.get_by_id(job.id)) item->update_progress(0.9f);
    }

    verify_checksum(job, *response);

    auto moved = move_to_output(job.source);
    if (!moved) return "Upload failed: " + moved.error();

    if (response->storage) {
        log_.info("Upload", "Upload successful: {} (Photo ID: {}), S3: {} in bucket {} ({})",
                  job.name, response->photo_id.value_or("N/A"),
                  response->storage->original_key, response->storage->bucket, response->storage->region);
    } else {
        log_.info("Upload", "Upload successful: {} (Photo ID: {})", job.name, response->photo_id.value_or("N/A"));
    }
    if (moved->filename() != job.source.filename()) {
        log_.info("Upload", "Name already taken in {}, stored as {}", output_dir_.string(), moved->filename().string());
    }
    return std::nullopt;
}

void UploadManager::verify_checksum(const UploadJob& job, const UploadResponse& response) {
    if (!response.meta || !response.meta->checksum) return;

    auto local = digest::sha256_file(job.source);
    if (!local) {
        log_.warn("Upload", "Cannot checksum {}: {}", job.name, digest::error_name(local.error()));
        return;
    }

    std::string remote = *response.meta->checksum;
    std::transform(remote.begin(), remote.end(), remote.begin(), [](unsigned char c) { return std::tolower(c); });
    if (remote != *local) {
        log_.warn("Upload", "Checksum mismatch for {}: local {} remote {}", job.name, *local, remote);
    }
}

std::expected<std::filesystem::path, std::string> UploadManager::move_to_output(const std::filesystem::path& source) {
    if (source.filename().empty()) return std::unexpected("Invalid file name");

    std::error_code ec;
    auto target = output_dir_ / source.filename();

    if (std::filesystem::exists(target, ec)) {
        const std::string stem = source.stem().string();
        if (stem.empty()) return std::unexpected("Invalid file stem");
        const std::string ext = source.extension().string();
        const std::string stamp = std::format("{:%Y%m%d_%H%M%S}",
                                              std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));

        target = output_dir_ / (stem + "_" + stamp + ext);
        for (int n = 1; std::filesystem::exists(target, ec); ++n) {
            target = output_dir_ / std::format("{}_{}_{}{}", stem, stamp, n, ext);
        }
    }

    std::filesystem::rename(source, target, ec);
    if (ec) return std::unexpected("Failed to move file: " + ec.message());
    return target;
}

void UploadManager::finish(const UploadJob& job, std::optional<std::string> failure) {
    std::optional<UploadItem> snapshot;
    {
        auto access = queue_.lock();
        if (UploadItem* item = access.get_by_id(job.id)) {
            if (failure) {
                item->fail_upload(*failure);
            } else {
                item->complete_upload();
            }
            snapshot = *item;
        }
    }

    try {
        if (failure) log_.error("Upload", "Upload failed for {}: {}", job.name, *failure);

        if (!snapshot) {
            // Cleared from the queue while the upload was running
            log_.warn("Upload", "Item {} is no longer in the queue", job.id);
        } else {
            FinishedCallback callback;
            {
                std::lock_guard lock(callback_mutex_);
                callback = on_finished_;
            }
            if (callback) callback(*snapshot);
        }
    } catch (const std::exception& e) {
        std::println(stderr, "[Upload] Finish hook failed for {}: {}", job.name, e.what());
    }

    // Must stay last: once active_ drops, wait_idle() returns and the manager may be destroyed
    std::lock_guard lock(idle_mutex_);
    --active_;
    idle_cv_.notify_all();
}

bool UploadManager::update_destination(const std::string& event_code) {
    auto old = destination_.update(event_code);
    if (!old) return false;

    log_.info("Upload", "Event code updated: {} -> {}", *old, event_code);
    return true;
}

void UploadManager::wait_idle() {
    std::unique_lock lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return active_.load() == 0; });
}

void UploadManager::set_on_finished(FinishedCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_finished_ = std::move(callback);
}

} // namespace perch
