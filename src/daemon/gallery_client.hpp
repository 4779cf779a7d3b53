//
// Created by cv2 on 08.10.2026.
//

#pragma once
#include <string>
#include <chrono>

#include "upload_transport.hpp"

namespace perch {

    // Classification of raw HTTP answers. Exposed so the rules can be
    // exercised without a server:
    //   non-2xx           -> Service "HTTP <code>: <body>"
    //   malformed JSON    -> Decode
    //   success == false  -> Service "<message>"
    std::expected<HealthResponse, TransportError> parse_health_response(long http_status, const std::string& body);
    std::expected<UploadResponse, TransportError> parse_upload_response(long http_status, const std::string& body);

    // image/jpeg, image/png, image/x-nikon-nef, application/octet-stream
    std::string mime_type_for(const std::filesystem::path& path);

    // "2026-10-08T14:03:11Z"
    std::string rfc3339_utc(std::chrono::system_clock::time_point tp);

    // HTTP client for the gallery service (libcurl).
    // Holds no connection state; every call uses its own easy handle.
    class GalleryClient : public UploadTransport {
    public:
        explicit GalleryClient(std::string base_url);

        std::expected<HealthResponse, TransportError> health_check(const std::string& api_key) override;

        std::expected<UploadResponse, TransportError> upload(
            const std::string& event_code,
            const std::filesystem::path& file_path,
            const std::string& api_key
        ) override;

        const std::string& base_url() const { return base_url_; }

        std::string health_url(const std::string& api_key) const;
        std::string upload_url(const std::string& event_code) const;

    private:
        std::string base_url_; // no trailing '/'
    };

} // namespace perch
