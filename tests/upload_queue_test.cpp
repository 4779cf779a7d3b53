//
// Created by cv2 on 12.10.2026.
//

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <mutex>
#include <thread>
#include <vector>

#include "daemon/upload_queue.hpp"
#include "common/log.hpp"
#include "test_support.hpp"

using perch::UploadQueue;
using perch::UploadItem;
using perch::QueueStats;
using perch::Thumbnail;

namespace {
    std::optional<Thumbnail> no_thumbnail(const std::filesystem::path&) {
        return std::nullopt;
    }

    void expect_consistent(const QueueStats& s) {
        EXPECT_EQ(s.queued + s.active + s.completed + s.failed, s.total);
    }
}

class UploadQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_.set_echo(false);
        queue_ = std::make_unique<UploadQueue>(&log_, no_thumbnail);
    }

    // Claim the next queued item the way the scheduler does
    std::optional<perch::ItemId> claim() {
        auto access = queue_->lock();
        UploadItem* item = access.next_queued();
        if (!item || !item->start_upload()) return std::nullopt;
        return item->id();
    }

    perch::OperatorLog log_;
    perch::test::TempDir dir_;
    std::unique_ptr<UploadQueue> queue_;
};

TEST_F(UploadQueueTest, EmptyQueueStats) {
    EXPECT_EQ(queue_->stats(), QueueStats{});
    EXPECT_TRUE(queue_->items().empty());
}

TEST_F(UploadQueueTest, AddTracksAbsolutePath) {
    auto id = queue_->add(dir_ / "photo.jpg");
    ASSERT_TRUE(id.has_value());

    auto item = queue_->find(*id);
    ASSERT_TRUE(item.has_value());
    EXPECT_TRUE(item->source_path().is_absolute());
    EXPECT_EQ(item->display_name(), "photo.jpg");
    EXPECT_TRUE(item->is_queued());
    EXPECT_EQ(queue_->stats(), (QueueStats{1, 1, 0, 0, 0}));
}

TEST_F(UploadQueueTest, DuplicatePathIsRejected) {
    auto first = queue_->add(dir_ / "photo.jpg");
    auto second = queue_->add(dir_ / "photo.jpg");
    // Same file spelled differently
    auto third = queue_->add(dir_.path() / "sub" / ".." / "photo.jpg");

    EXPECT_TRUE(first.has_value());
    EXPECT_FALSE(second.has_value());
    EXPECT_FALSE(third.has_value());
    EXPECT_EQ(queue_->stats().total, 1u);
    EXPECT_TRUE(queue_->contains(dir_ / "photo.jpg"));
}

TEST_F(UploadQueueTest, FailedItemStillBlocksReinsertion) {
    auto id = queue_->add(dir_ / "photo.jpg");
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(claim(), id);
    {
        auto access = queue_->lock();
        ASSERT_TRUE(access.get_by_id(*id)->fail_upload("Upload failed: HTTP error: timeout"));
    }

    EXPECT_FALSE(queue_->add(dir_ / "photo.jpg").has_value());
    EXPECT_EQ(queue_->stats(), (QueueStats{1, 0, 0, 0, 1}));
}

TEST_F(UploadQueueTest, ClaimsAreFifo) {
    auto a = queue_->add(dir_ / "a.jpg");
    auto b = queue_->add(dir_ / "b.jpg");
    auto c = queue_->add(dir_ / "c.jpg");

    EXPECT_EQ(claim(), a);
    EXPECT_EQ(claim(), b);
    EXPECT_EQ(claim(), c);
    EXPECT_EQ(claim(), std::nullopt);
    EXPECT_EQ(queue_->stats(), (QueueStats{3, 0, 3, 0, 0}));
}

TEST_F(UploadQueueTest, ConcurrentClaimsNeverShareAnItem) {
    constexpr int kItems = 200;
    for (int i = 0; i < kItems; ++i) {
        ASSERT_TRUE(queue_->add(dir_ / ("img_" + std::to_string(i) + ".jpg")).has_value());
    }

    std::mutex seen_mutex;
    std::vector<perch::ItemId> seen;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            while (auto id = claim()) {
                std::lock_guard lock(seen_mutex);
                seen.push_back(*id);
            }
        });
    }
    for (auto& t : threads) t.join();

    std::set<perch::ItemId> unique(seen.begin(), seen.end());
    EXPECT_EQ(seen.size(), static_cast<size_t>(kItems));
    EXPECT_EQ(unique.size(), static_cast<size_t>(kItems));
}

TEST_F(UploadQueueTest, ConcurrentAddsOfSamePathYieldOneItem) {
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            if (queue_->add(dir_ / "burst.jpg")) ++accepted;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(queue_->stats().total, 1u);
}

TEST_F(UploadQueueTest, StatsStayConsistentUnderChurn) {
    for (int i = 0; i < 50; ++i) queue_->add(dir_ / ("f" + std::to_string(i) + ".png"));

    std::atomic<bool> done{false};
    std::thread worker([&] {
        int n = 0;
        while (auto id = claim()) {
            auto access = queue_->lock();
            UploadItem* item = access.get_by_id(*id);
            if (n++ % 2) item->complete_upload();
            else item->fail_upload("nope");
        }
        done = true;
    });

    while (!done) expect_consistent(queue_->stats());
    worker.join();

    QueueStats s = queue_->stats();
    expect_consistent(s);
    EXPECT_EQ(s.completed + s.failed, 50u);
}

TEST_F(UploadQueueTest, ThumbnailerResultIsStored) {
    UploadQueue queue(&log_, [](const std::filesystem::path&) -> std::optional<Thumbnail> {
        return Thumbnail{10, 5, {0x89, 'P', 'N', 'G'}};
    });

    auto id = queue.add(dir_ / "photo.jpg");
    ASSERT_TRUE(id.has_value());
    auto thumb = queue.thumbnail(*id);
    ASSERT_TRUE(thumb.has_value());
    EXPECT_EQ(thumb->width, 10);
    EXPECT_EQ(thumb->height, 5);
    EXPECT_TRUE(queue.find(*id)->thumbnail().has_value());

    EXPECT_FALSE(queue_->thumbnail(*id).has_value());
}

TEST_F(UploadQueueTest, ClearOperations) {
    auto done = queue_->add(dir_ / "done.jpg");
    auto bad = queue_->add(dir_ / "bad.jpg");
    auto waiting = queue_->add(dir_ / "waiting.jpg");
    {
        auto access = queue_->lock();
        access.next_queued()->start_upload();
        access.get_by_id(*done)->complete_upload();
        access.next_queued()->start_upload();
        access.get_by_id(*bad)->fail_upload("broken");
    }

    EXPECT_EQ(queue_->clear_completed(), 1u);
    EXPECT_EQ(queue_->clear_failed(), 1u);
    EXPECT_EQ(queue_->stats(), (QueueStats{1, 1, 0, 0, 0}));

    // Cleared paths may be queued again
    EXPECT_TRUE(queue_->add(dir_ / "done.jpg").has_value());

    EXPECT_EQ(queue_->remove(*waiting), 1u);
    EXPECT_EQ(queue_->remove(*waiting), 0u);
    EXPECT_EQ(queue_->clear_all(), 1u);
    EXPECT_EQ(queue_->stats(), QueueStats{});
}
