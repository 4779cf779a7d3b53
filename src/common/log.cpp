//
// Created by cv2 on 04.10.2026.
//

#include "log.hpp"
#include <iostream>
#include <print>
#include <algorithm>

namespace perch {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

OperatorLog::OperatorLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void OperatorLog::write(LogLevel level, std::string_view tag, std::string text) {
    LogLine line{level, std::string(tag), std::move(text), std::chrono::system_clock::now()};

    Subscriber subscriber;
    {
        std::lock_guard lock(mutex_);
        if (echo_) {
            if (level == LogLevel::Info) {
                std::println("[{}] {}", line.tag, line.text);
            } else {
                std::println(stderr, "[{}] {}", line.tag, line.text);
            }
        }

        backlog_.push_back(line);
        while (backlog_.size() > capacity_) backlog_.pop_front();
        subscriber = subscriber_;
    }

    // Outside the lock: the subscriber may log or take other locks
    if (subscriber) subscriber(line);
}

std::vector<LogLine> OperatorLog::recent(size_t limit) const {
    std::lock_guard lock(mutex_);
    size_t start = 0;
    if (limit != 0 && backlog_.size() > limit) start = backlog_.size() - limit;
    return std::vector<LogLine>(backlog_.begin() + static_cast<std::ptrdiff_t>(start), backlog_.end());
}

void OperatorLog::set_subscriber(Subscriber subscriber) {
    std::lock_guard lock(mutex_);
    subscriber_ = std::move(subscriber);
}

void OperatorLog::set_echo(bool echo) {
    std::lock_guard lock(mutex_);
    echo_ = echo;
}

std::string redact_key(std::string_view key) {
    return std::string(key.substr(0, std::min<size_t>(key.size(), 10))) + "...";
}

} // namespace perch
