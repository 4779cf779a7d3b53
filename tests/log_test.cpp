//
// Created by cv2 on 12.10.2026.
//

#include <gtest/gtest.h>

#include <vector>
#include <string>

#include "common/log.hpp"

using perch::OperatorLog;
using perch::LogLevel;

TEST(OperatorLogTest, KeepsBoundedBacklog) {
    OperatorLog log(3);
    log.set_echo(false);

    for (int i = 0; i < 5; ++i) log.info("Test", "line {}", i);

    auto lines = log.recent();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines.front().text, "line 2");
    EXPECT_EQ(lines.back().text, "line 4");
}

TEST(OperatorLogTest, RecentHonoursLimit) {
    OperatorLog log;
    log.set_echo(false);
    log.info("A", "one");
    log.warn("B", "two");
    log.error("C", "three");

    auto last = log.recent(2);
    ASSERT_EQ(last.size(), 2u);
    EXPECT_EQ(last[0].level, LogLevel::Warning);
    EXPECT_EQ(last[0].tag, "B");
    EXPECT_EQ(last[1].level, LogLevel::Error);
    EXPECT_STREQ(perch::level_name(last[1].level), "error");
}

TEST(OperatorLogTest, SubscriberSeesEveryLine) {
    OperatorLog log;
    log.set_echo(false);
    std::vector<std::string> seen;
    log.set_subscriber([&seen](const perch::LogLine& line) { seen.push_back(line.tag + ":" + line.text); });

    log.info("Upload", "started {}", 1);
    log.set_subscriber({});
    log.info("Upload", "ignored");

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "Upload:started 1");
}

TEST(OperatorLogTest, RedactKeyKeepsTenCharacters) {
    EXPECT_EQ(perch::redact_key("abcdefghijklmnop"), "abcdefghij...");
    EXPECT_EQ(perch::redact_key("short"), "short...");
}
