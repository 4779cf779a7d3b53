//
// Created by cv2 on 12.10.2026.
//

#include <gtest/gtest.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "common/thumbnail.hpp"
#include "test_support.hpp"

namespace {
    void write_image(const std::filesystem::path& path, int width, int height) {
        cv::Mat image(height, width, CV_8UC3, cv::Scalar(40, 120, 200));
        ASSERT_TRUE(cv::imwrite(path.string(), image));
    }
}

TEST(ThumbnailTest, LargeImageFitsInBox) {
    perch::test::TempDir dir;
    auto path = dir / "wide.png";
    write_image(path, 400, 200);

    auto thumb = perch::make_thumbnail(path);
    ASSERT_TRUE(thumb.has_value());
    EXPECT_EQ(thumb->width, 100);
    EXPECT_EQ(thumb->height, 50);

    cv::Mat decoded = cv::imdecode(thumb->png, cv::IMREAD_COLOR);
    EXPECT_EQ(decoded.cols, 100);
    EXPECT_EQ(decoded.rows, 50);
}

TEST(ThumbnailTest, TallImageKeepsAspect) {
    perch::test::TempDir dir;
    auto path = dir / "tall.jpg";
    write_image(path, 150, 600);

    auto thumb = perch::make_thumbnail(path);
    ASSERT_TRUE(thumb.has_value());
    EXPECT_EQ(thumb->height, 100);
    EXPECT_EQ(thumb->width, 25);
}

TEST(ThumbnailTest, SmallImageIsNotUpscaled) {
    perch::test::TempDir dir;
    auto path = dir / "small.png";
    write_image(path, 40, 30);

    auto thumb = perch::make_thumbnail(path);
    ASSERT_TRUE(thumb.has_value());
    EXPECT_EQ(thumb->width, 40);
    EXPECT_EQ(thumb->height, 30);
    EXPECT_FALSE(thumb->png.empty());
}

TEST(ThumbnailTest, UndecodableFileGivesNothing) {
    perch::test::TempDir dir;
    auto path = dir / "fake.jpg";
    perch::test::write_file(path, "this is not an image");

    EXPECT_FALSE(perch::make_thumbnail(path).has_value());
    EXPECT_FALSE(perch::make_thumbnail(dir / "missing.jpg").has_value());
}
