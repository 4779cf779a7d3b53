//
// Created by cv2 on 07.10.2026.
//

#include "upload_queue.hpp"
#include "../common/digest.hpp"
#include "../common/log.hpp"
#include <algorithm>

namespace perch {

// --- Access ---

UploadQueue::Access::Access(UploadQueue& queue) : queue_(queue), lock_(queue.mutex_) {}

UploadItem* UploadQueue::Access::next_queued() {
    auto it = std::find_if(queue_.items_.begin(), queue_.items_.end(),
                           [](const UploadItem& item) { return item.is_queued(); });
    return it == queue_.items_.end() ? nullptr : &*it;
}

UploadItem* UploadQueue::Access::get_by_id(const ItemId& id) {
    auto it = std::find_if(queue_.items_.begin(), queue_.items_.end(),
                           [&](const UploadItem& item) { return item.id() == id; });
    return it == queue_.items_.end() ? nullptr : &*it;
}

const UploadItem* UploadQueue::Access::get_by_id(const ItemId& id) const {
    auto it = std::find_if(queue_.items_.cbegin(), queue_.items_.cend(),
                           [&](const UploadItem& item) { return item.id() == id; });
    return it == queue_.items_.cend() ? nullptr : &*it;
}

// --- Queue ---

UploadQueue::UploadQueue(OperatorLog* log, Thumbnailer thumbnailer)
    : log_(log), thumbnailer_(std::move(thumbnailer)) {
    if (!thumbnailer_) {
        thumbnailer_ = [](const std::filesystem::path& p) { return make_thumbnail(p); };
    }
}

UploadQueue::Access UploadQueue::lock() {
    return Access(*this);
}

bool UploadQueue::tracked_locked(const std::filesystem::path& path) const {
    if (pending_.contains(path)) return true;
    return std::any_of(items_.begin(), items_.end(),
                       [&](const UploadItem& item) { return item.source_path() == path; });
}

std::optional<ItemId> UploadQueue::add(const std::filesystem::path& raw_path) {
    std::error_code ec;
    std::filesystem::path path = std::filesystem::absolute(raw_path, ec);
    if (ec) path = raw_path;
    path = path.lexically_normal();

    // 1. Reserve the path
    {
        std::lock_guard lock(mutex_);
        if (tracked_locked(path)) {
            if (log_) log_->info("Queue", "File already exists in queue: {}", path.string());
            return std::nullopt;
        }
        pending_.insert(path);
    }

    auto id = digest::random_uuid();
    if (!id) {
        if (log_) log_->error("Queue", "Cannot allocate item id for {}: {}", path.string(), digest::error_name(id.error()));
        std::lock_guard lock(mutex_);
        pending_.erase(path);
        return std::nullopt;
    }

    UploadItem item(*id, path);

    // 2. Thumbnail without holding the lock
    if (auto thumb = thumbnailer_(path)) {
        item.set_thumbnail(std::move(*thumb));
        if (log_) log_->info("Queue", "Thumbnail generated for: {}", item.display_name());
    } else {
        if (log_) log_->warn("Queue", "Failed to generate thumbnail for: {}", item.display_name());
    }

    // 3. Publish
    size_t total = 0;
    {
        std::lock_guard lock(mutex_);
        pending_.erase(path);
        items_.push_back(std::move(item));
        total = items_.size();
    }

    if (log_) log_->info("Queue", "File added to queue with ID: {} ({} items total)", *id, total);
    return *id;
}

std::optional<UploadItem> UploadQueue::find(const ItemId& id) const {
    std::lock_guard lock(mutex_);
    for (const auto& item : items_) {
        if (item.id() == id) return item;
    }
    return std::nullopt;
}

std::vector<UploadItem> UploadQueue::items() const {
    std::lock_guard lock(mutex_);
    return std::vector<UploadItem>(items_.begin(), items_.end());
}

std::optional<Thumbnail> UploadQueue::thumbnail(const ItemId& id) const {
    std::lock_guard lock(mutex_);
    for (const auto& item : items_) {
        if (item.id() == id) return item.thumbnail();
    }
    return std::nullopt;
}

bool UploadQueue::contains(const std::filesystem::path& path) const {
    std::lock_guard lock(mutex_);
    return tracked_locked(path);
}

QueueStats UploadQueue::stats() const {
    std::lock_guard lock(mutex_);
    QueueStats s;
    s.total = items_.size();
    for (const auto& item : items_) {
        if (item.is_queued()) ++s.queued;
        else if (item.is_uploading()) ++s.active;
        else if (item.is_completed()) ++s.completed;
        else if (item.is_failed()) ++s.failed;
    }
    return s;
}

size_t UploadQueue::clear_completed() {
    std::lock_guard lock(mutex_);
    return std::erase_if(items_, [](const UploadItem& item) { return item.is_completed(); });
}

size_t UploadQueue::clear_failed() {
    std::lock_guard lock(mutex_);
    return std::erase_if(items_, [](const UploadItem& item) { return item.is_failed(); });
}

size_t UploadQueue::clear_all() {
    std::lock_guard lock(mutex_);
    size_t n = items_.size();
    items_.clear();
    return n;
}

size_t UploadQueue::remove(const ItemId& id) {
    std::lock_guard lock(mutex_);
    return std::erase_if(items_, [&](const UploadItem& item) { return item.id() == id; });
}

} // namespace perch
