//
// Created by cv2 on 07.10.2026.
//

#pragma once
#include <string>
#include <variant>
#include <optional>
#include <chrono>
#include <filesystem>

#include "../common/thumbnail.hpp"

namespace perch {

    using ItemId = std::string;
    using Clock = std::chrono::system_clock;

    namespace status {
        struct Queued {};
        struct Uploading {};
        struct Completed {};
        struct Failed {
            std::string message;
        };
    }

    using UploadStatus = std::variant<status::Queued, status::Uploading, status::Completed, status::Failed>;

    // "queued", "uploading", "completed", "failed"
    const char* status_name(const UploadStatus& s);

    bool is_terminal(const UploadStatus& s);

    // One file's journey through the pipeline.
    // Status only moves forward: Queued -> Uploading -> Completed | Failed.
    // The transition methods refuse anything else and return false.
    class UploadItem {
    public:
        UploadItem(ItemId id, std::filesystem::path source_path);

        const ItemId& id() const { return id_; }
        const std::filesystem::path& source_path() const { return source_path_; }
        const std::string& display_name() const { return display_name_; }

        const UploadStatus& status() const { return status_; }
        bool is_queued() const { return std::holds_alternative<status::Queued>(status_); }
        bool is_uploading() const { return std::holds_alternative<status::Uploading>(status_); }
        bool is_completed() const { return std::holds_alternative<status::Completed>(status_); }
        bool is_failed() const { return std::holds_alternative<status::Failed>(status_); }

        // Failure message, empty unless Failed
        std::string error() const;

        Clock::time_point added_at() const { return added_at_; }
        std::optional<Clock::time_point> started_at() const { return started_at_; }
        std::optional<Clock::time_point> completed_at() const { return completed_at_; }

        float progress() const { return progress_; }

        const std::optional<Thumbnail>& thumbnail() const { return thumbnail_; }
        void set_thumbnail(Thumbnail thumb) { thumbnail_ = std::move(thumb); }

        bool start_upload();
        bool complete_upload();
        bool fail_upload(std::string message);

        // Clamped to [0, 1]; ignored once the item is terminal
        void update_progress(float progress);

    private:
        ItemId id_;
        std::filesystem::path source_path_;
        std::string display_name_;

        UploadStatus status_ = status::Queued{};

        Clock::time_point added_at_;
        std::optional<Clock::time_point> started_at_;
        std::optional<Clock::time_point> completed_at_;

        float progress_ = 0.0f;
        std::optional<Thumbnail> thumbnail_;
    };

} // namespace perch
