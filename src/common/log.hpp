//
// Created by cv2 on 04.10.2026.
//

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <deque>
#include <mutex>
#include <format>
#include <functional>
#include <chrono>

namespace perch {

    enum class LogLevel {
        Info,
        Warning,
        Error
    };

    struct LogLine {
        LogLevel level;
        std::string tag;
        std::string text;
        std::chrono::system_clock::time_point at;
    };

    const char* level_name(LogLevel level);

    // Operator-visible log channel.
    // Every line is printed the usual way ("[Tag] text", errors to stderr)
    // and kept in a bounded backlog the control socket can replay.
    class OperatorLog {
    public:
        using Subscriber = std::function<void(const LogLine&)>;

        explicit OperatorLog(size_t capacity = 500);

        template <typename... Args>
        void info(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
            write(LogLevel::Info, tag, std::format(fmt, std::forward<Args>(args)...));
        }

        template <typename... Args>
        void warn(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
            write(LogLevel::Warning, tag, std::format(fmt, std::forward<Args>(args)...));
        }

        template <typename... Args>
        void error(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
            write(LogLevel::Error, tag, std::format(fmt, std::forward<Args>(args)...));
        }

        void write(LogLevel level, std::string_view tag, std::string text);

        // Most recent lines, oldest first. limit == 0 returns the whole backlog.
        std::vector<LogLine> recent(size_t limit = 0) const;

        // Only one subscriber; perchd forwards lines to control clients.
        void set_subscriber(Subscriber subscriber);

        // Silence stdout/stderr echo (tests)
        void set_echo(bool echo);

    private:
        mutable std::mutex mutex_;
        std::deque<LogLine> backlog_;
        size_t capacity_;
        Subscriber subscriber_;
        bool echo_ = true;
    };

    // "abcdefghij..." - never log a full credential
    std::string redact_key(std::string_view key);

} // namespace perch
