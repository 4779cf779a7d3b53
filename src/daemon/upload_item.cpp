//
// Created by cv2 on 07.10.2026.
//

#include "upload_item.hpp"
#include <algorithm>

namespace perch {

namespace {
    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
}

const char* status_name(const UploadStatus& s) {
    return std::visit(overloaded{
        [](const status::Queued&) { return "queued"; },
        [](const status::Uploading&) { return "uploading"; },
        [](const status::Completed&) { return "completed"; },
        [](const status::Failed&) { return "failed"; },
    }, s);
}

bool is_terminal(const UploadStatus& s) {
    return std::holds_alternative<status::Completed>(s) || std::holds_alternative<status::Failed>(s);
}

UploadItem::UploadItem(ItemId id, std::filesystem::path source_path)
    : id_(std::move(id)),
      source_path_(std::move(source_path)),
      display_name_(source_path_.filename().string()),
      added_at_(Clock::now()) {}

std::string UploadItem::error() const {
    if (auto* failed = std::get_if<status::Failed>(&status_)) return failed->message;
    return {};
}

bool UploadItem::start_upload() {
    if (!is_queued()) return false;
    status_ = status::Uploading{};
    started_at_ = Clock::now();
    progress_ = 0.1f;
    return true;
}

bool UploadItem::complete_upload() {
    if (!is_uploading()) return false;
    status_ = status::Completed{};
    completed_at_ = Clock::now();
    progress_ = 1.0f;
    return true;
}

bool UploadItem::fail_upload(std::string message) {
    if (!is_uploading()) return false;
    status_ = status::Failed{std::move(message)};
    completed_at_ = Clock::now();
    return true;
}

void UploadItem::update_progress(float progress) {
    if (is_terminal(status_)) return;
    progress_ = std::clamp(progress, 0.0f, 1.0f);
}

} // namespace perch
