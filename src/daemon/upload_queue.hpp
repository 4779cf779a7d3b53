//
// Created by cv2 on 07.10.2026.
//

#pragma once
#include <string>
#include <vector>
#include <deque>
#include <set>
#include <mutex>
#include <optional>
#include <functional>
#include <filesystem>

#include "upload_item.hpp"

namespace perch {

    class OperatorLog;

    struct QueueStats {
        size_t total = 0;
        size_t queued = 0;
        size_t active = 0;
        size_t completed = 0;
        size_t failed = 0;

        bool operator==(const QueueStats&) const = default;
    };

    // In-memory, insertion-ordered set of upload items keyed by source path.
    // One mutex guards everything; it is never held across file or network I/O.
    class UploadQueue {
    public:
        using Thumbnailer = std::function<std::optional<Thumbnail>(const std::filesystem::path&)>;

        // Exclusive access to the whole queue for as long as it lives.
        // Claiming an item = next_queued() + start_upload() through one Access.
        class Access {
        public:
            UploadItem* next_queued();
            UploadItem* get_by_id(const ItemId& id);
            const UploadItem* get_by_id(const ItemId& id) const;

        private:
            friend class UploadQueue;
            explicit Access(UploadQueue& queue);

            UploadQueue& queue_;
            std::unique_lock<std::mutex> lock_;
        };

        explicit UploadQueue(OperatorLog* log = nullptr, Thumbnailer thumbnailer = {});

        UploadQueue(const UploadQueue&) = delete;
        UploadQueue& operator=(const UploadQueue&) = delete;

        Access lock();

        // nullopt if the path is already tracked (in any state) or being added.
        // Thumbnail failures are swallowed; the item is added without one.
        std::optional<ItemId> add(const std::filesystem::path& path);

        // Copies, taken under the lock
        std::optional<UploadItem> find(const ItemId& id) const;
        std::vector<UploadItem> items() const;
        std::optional<Thumbnail> thumbnail(const ItemId& id) const;

        bool contains(const std::filesystem::path& path) const;

        QueueStats stats() const;

        // Return how many items were removed
        size_t clear_completed();
        size_t clear_failed();
        size_t clear_all();
        size_t remove(const ItemId& id);

    private:
        bool tracked_locked(const std::filesystem::path& path) const;

        OperatorLog* log_;
        Thumbnailer thumbnailer_;

        mutable std::mutex mutex_;
        std::deque<UploadItem> items_;
        // Paths whose insertion is in progress (thumbnail being made outside the lock)
        std::set<std::filesystem::path> pending_;
    };

} // namespace perch
