//
// Created by cv2 on 12.10.2026.
//

#include <gtest/gtest.h>

#include <chrono>

#include "daemon/gallery_client.hpp"
#include "test_support.hpp"

using perch::GalleryClient;
using perch::TransportError;

TEST(GalleryClientTest, UrlsAreBuiltFromTrimmedBase) {
    GalleryClient client("https://gallery.example.com//");
    EXPECT_EQ(client.base_url(), "https://gallery.example.com");
    EXPECT_EQ(client.upload_url("WEDDING24"), "https://gallery.example.com/api/gallery/WEDDING24/photos");
    EXPECT_EQ(client.health_url("abc"), "https://gallery.example.com/check-api-key?api_key=abc");
}

TEST(GalleryClientTest, UrlPartsAreEscaped) {
    GalleryClient client("http://localhost:8080");
    EXPECT_EQ(client.upload_url("a b/c"), "http://localhost:8080/api/gallery/a%20b%2Fc/photos");
    EXPECT_EQ(client.health_url("k&y=1"), "http://localhost:8080/check-api-key?api_key=k%26y%3D1");
}

TEST(GalleryClientTest, HealthResponseSuccess) {
    auto r = perch::parse_health_response(200, R"({"success":true,"message":"API key is valid","timestamp":"2026-10-12T10:00:00Z"})");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->message, "API key is valid");
    EXPECT_EQ(r->timestamp, "2026-10-12T10:00:00Z");
}

TEST(GalleryClientTest, NonSuccessStatusIsServiceError) {
    auto r = perch::parse_health_response(401, "Unauthorized");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, TransportError::Kind::Service);
    EXPECT_EQ(r.error().message, "HTTP 401: Unauthorized");
    EXPECT_EQ(perch::describe(r.error()), "API returned error: HTTP 401: Unauthorized");
}

TEST(GalleryClientTest, MalformedBodyIsDecodeError) {
    auto r = perch::parse_upload_response(200, "<html>oops</html>");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, TransportError::Kind::Decode);

    auto missing = perch::parse_upload_response(200, R"({"message":"no success flag"})");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, TransportError::Kind::Decode);
}

TEST(GalleryClientTest, SuccessFalseCarriesServiceMessage) {
    auto r = perch::parse_upload_response(200, R"({"success":false,"message":"quota exceeded"})");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, TransportError::Kind::Service);
    EXPECT_EQ(r.error().message, "quota exceeded");
}

TEST(GalleryClientTest, FullUploadResponse) {
    auto r = perch::parse_upload_response(201, R"({
        "success": true,
        "message": "Photo uploaded",
        "photo_id": "ph_42",
        "s3": {"original_key": "evt/ph_42.jpg", "thumb_key": null, "bucket": "photos", "region": "eu-central-1"},
        "meta": {"original_name": "a.jpg", "local_path": "/p/a.jpg", "shot_at": "2026-10-12T10:00:00Z",
                 "checksum": "ABCDEF", "event_code": "EVT"}
    })");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->photo_id, "ph_42");
    ASSERT_TRUE(r->storage.has_value());
    EXPECT_EQ(r->storage->bucket, "photos");
    EXPECT_FALSE(r->storage->thumb_key.has_value());
    ASSERT_TRUE(r->meta.has_value());
    EXPECT_EQ(r->meta->checksum, "ABCDEF");
    EXPECT_EQ(r->meta->event_code, "EVT");
}

TEST(GalleryClientTest, MinimalUploadResponse) {
    auto r = perch::parse_upload_response(200, R"({"success":true,"message":"ok"})");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->photo_id.has_value());
    EXPECT_FALSE(r->storage.has_value());
    EXPECT_FALSE(r->meta.has_value());
}

TEST(GalleryClientTest, MimeTypes) {
    EXPECT_EQ(perch::mime_type_for("a.JPG"), "image/jpeg");
    EXPECT_EQ(perch::mime_type_for("a.jpeg"), "image/jpeg");
    EXPECT_EQ(perch::mime_type_for("a.png"), "image/png");
    EXPECT_EQ(perch::mime_type_for("a.NEF"), "image/x-nikon-nef");
    EXPECT_EQ(perch::mime_type_for("a.tiff"), "application/octet-stream");
}

TEST(GalleryClientTest, Rfc3339IsUtcSeconds) {
    using namespace std::chrono;
    sys_seconds tp = sys_days{year{2026} / 10 / 8} + hours{14} + minutes{3} + seconds{11};
    EXPECT_EQ(perch::rfc3339_utc(tp + milliseconds{750}), "2026-10-08T14:03:11Z");
}

TEST(GalleryClientTest, MissingFileIsFileIoError) {
    perch::test::TempDir dir;
    GalleryClient client("http://127.0.0.1:9");
    auto r = client.upload("EVT", dir / "missing.jpg", "key");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, TransportError::Kind::FileIo);
    EXPECT_EQ(perch::describe(r.error()).rfind("IO error: ", 0), 0u);
}

TEST(GalleryClientTest, UnreachableServerIsTransportError) {
    perch::test::TempDir dir;
    perch::test::write_file(dir / "a.jpg", "jpeg bytes");
    GalleryClient client("http://127.0.0.1:1");
    auto r = client.upload("EVT", dir / "a.jpg", "key");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, TransportError::Kind::Transport);
}
