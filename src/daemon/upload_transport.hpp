//
// Created by cv2 on 08.10.2026.
//

#pragma once
#include <string>
#include <optional>
#include <expected>
#include <filesystem>

namespace perch {

    struct TransportError {
        enum class Kind {
            Transport, // could not talk to the service at all
            Decode,    // response body is not what we expect
            FileIo,    // local file could not be read
            Service    // service answered, but said no
        };

        Kind kind;
        std::string message;
    };

    const char* kind_name(TransportError::Kind kind);

    // "<kind>: <message>"; for Service errors the message is passed through verbatim
    std::string describe(const TransportError& e);

    struct HealthResponse {
        bool success = false;
        std::string message;
        std::string timestamp;
    };

    struct StorageInfo {
        std::string original_key;
        std::optional<std::string> thumb_key;
        std::string bucket;
        std::string region;
    };

    struct UploadMeta {
        std::string original_name;
        std::string local_path;
        std::string shot_at;
        std::optional<std::string> checksum;
        std::string event_code;
    };

    struct UploadResponse {
        bool success = false;
        std::string message;
        std::optional<std::string> photo_id;
        std::optional<StorageInfo> storage;
        std::optional<UploadMeta> meta;
    };

    // What the upload manager needs from the remote gallery.
    // Implementations must be safe to call from several threads at once.
    class UploadTransport {
    public:
        virtual ~UploadTransport() = default;

        virtual std::expected<HealthResponse, TransportError> health_check(const std::string& api_key) = 0;

        virtual std::expected<UploadResponse, TransportError> upload(
            const std::string& event_code,
            const std::filesystem::path& file_path,
            const std::string& api_key
        ) = 0;
    };

} // namespace perch
