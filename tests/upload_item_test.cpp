//
// Created by cv2 on 12.10.2026.
//

#include <gtest/gtest.h>

#include "daemon/upload_item.hpp"

using perch::UploadItem;

TEST(UploadItemTest, NewItemIsQueued) {
    UploadItem item("id-1", "/photos/IMG_0001.jpg");

    EXPECT_TRUE(item.is_queued());
    EXPECT_EQ(item.display_name(), "IMG_0001.jpg");
    EXPECT_FLOAT_EQ(item.progress(), 0.0f);
    EXPECT_FALSE(item.started_at().has_value());
    EXPECT_FALSE(item.completed_at().has_value());
    EXPECT_STREQ(perch::status_name(item.status()), "queued");
    EXPECT_TRUE(item.error().empty());
}

TEST(UploadItemTest, SuccessfulLifecycle) {
    UploadItem item("id-1", "/photos/a.jpg");

    ASSERT_TRUE(item.start_upload());
    EXPECT_TRUE(item.is_uploading());
    EXPECT_FLOAT_EQ(item.progress(), 0.1f);
    EXPECT_TRUE(item.started_at().has_value());

    item.update_progress(0.9f);
    ASSERT_TRUE(item.complete_upload());
    EXPECT_TRUE(item.is_completed());
    EXPECT_FLOAT_EQ(item.progress(), 1.0f);
    ASSERT_TRUE(item.completed_at().has_value());
    EXPECT_GE(*item.completed_at(), *item.started_at());
    EXPECT_TRUE(perch::is_terminal(item.status()));
}

TEST(UploadItemTest, FailureKeepsMessageAndProgress) {
    UploadItem item("id-1", "/photos/a.jpg");
    item.start_upload();

    ASSERT_TRUE(item.fail_upload("Upload failed: API returned error: quota exceeded"));
    EXPECT_TRUE(item.is_failed());
    EXPECT_EQ(item.error(), "Upload failed: API returned error: quota exceeded");
    EXPECT_FLOAT_EQ(item.progress(), 0.1f);
    EXPECT_STREQ(perch::status_name(item.status()), "failed");
}

TEST(UploadItemTest, IllegalTransitionsAreRejected) {
    UploadItem item("id-1", "/photos/a.jpg");

    EXPECT_FALSE(item.complete_upload());
    EXPECT_FALSE(item.fail_upload("nope"));
    EXPECT_TRUE(item.is_queued());

    item.start_upload();
    EXPECT_FALSE(item.start_upload());

    item.complete_upload();
    EXPECT_FALSE(item.fail_upload("late"));
    EXPECT_FALSE(item.start_upload());
    EXPECT_TRUE(item.is_completed());
}

TEST(UploadItemTest, ProgressIsClampedAndFrozenWhenTerminal) {
    UploadItem item("id-1", "/photos/a.jpg");
    item.update_progress(7.0f);
    EXPECT_FLOAT_EQ(item.progress(), 1.0f);
    item.update_progress(-1.0f);
    EXPECT_FLOAT_EQ(item.progress(), 0.0f);

    item.start_upload();
    item.fail_upload("x");
    item.update_progress(0.5f);
    EXPECT_FLOAT_EQ(item.progress(), 0.1f);
}
