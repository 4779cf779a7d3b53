//
// Created by cv2 on 08.10.2026.
//

#include "gallery_client.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <format>
#include <algorithm>
#include <cctype>

namespace perch {

using json = nlohmann::json;

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using MimePtr = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlPtr make_handle() {
    ensure_curl_global();
    return CurlPtr(curl_easy_init(), curl_easy_cleanup);
}

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::string escape(CURL* curl, const std::string& s) {
    char* out = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    if (!out) return s;
    std::string result(out);
    curl_free(out);
    return result;
}

TransportError transport_error(const std::string& message) {
    return TransportError{TransportError::Kind::Transport, message};
}

TransportError decode_error(const std::string& message) {
    return TransportError{TransportError::Kind::Decode, message};
}

TransportError service_error(const std::string& message) {
    return TransportError{TransportError::Kind::Service, message};
}

bool http_ok(long status) { return status >= 200 && status < 300; }

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

// Performs the request and collects the body. Returns the HTTP status.
std::expected<long, TransportError> perform(CURL* curl, std::string& body) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "perch/1.0");

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return std::unexpected(transport_error(detail));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    return status;
}

} // namespace

// --- Response classification ---

std::expected<HealthResponse, TransportError> parse_health_response(long http_status, const std::string& body) {
    if (!http_ok(http_status)) {
        return std::unexpected(service_error(std::format("HTTP {}: {}", http_status, body)));
    }

    HealthResponse r;
    try {
        json j = json::parse(body);
        r.success = j.at("success").get<bool>();
        r.message = j.at("message").get<std::string>();
        r.timestamp = j.at("timestamp").get<std::string>();
    } catch (const json::exception& e) {
        return std::unexpected(decode_error(e.what()));
    }

    if (!r.success) return std::unexpected(service_error(r.message));
    return r;
}

std::expected<UploadResponse, TransportError> parse_upload_response(long http_status, const std::string& body) {
    if (!http_ok(http_status)) {
        return std::unexpected(service_error(std::format("HTTP {}: {}", http_status, body)));
    }

    UploadResponse r;
    try {
        json j = json::parse(body);
        r.success = j.at("success").get<bool>();
        r.message = j.at("message").get<std::string>();
        r.photo_id = optional_string(j, "photo_id");

        if (j.contains("s3") && j["s3"].is_object()) {
            const auto& s3 = j["s3"];
            StorageInfo info;
            info.original_key = s3.at("original_key").get<std::string>();
            info.thumb_key = optional_string(s3, "thumb_key");
            info.bucket = s3.at("bucket").get<std::string>();
            info.region = s3.at("region").get<std::string>();
            r.storage = std::move(info);
        }

        if (j.contains("meta") && j["meta"].is_object()) {
            const auto& m = j["meta"];
            UploadMeta meta;
            meta.original_name = m.at("original_name").get<std::string>();
            meta.local_path = m.at("local_path").get<std::string>();
            meta.shot_at = m.at("shot_at").get<std::string>();
            meta.checksum = optional_string(m, "checksum");
            meta.event_code = m.at("event_code").get<std::string>();
            r.meta = std::move(meta);
        }
    } catch (const json::exception& e) {
        return std::unexpected(decode_error(e.what()));
    }

    if (!r.success) return std::unexpected(service_error(r.message));
    return r;
}

std::string mime_type_for(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png") return "image/png";
    if (ext == ".nef") return "image/x-nikon-nef";
    return "application/octet-stream";
}

std::string rfc3339_utc(std::chrono::system_clock::time_point tp) {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(tp));
}

// --- Client ---

GalleryClient::GalleryClient(std::string base_url) : base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string GalleryClient::health_url(const std::string& api_key) const {
    auto curl = make_handle();
    std::string key = curl ? escape(curl.get(), api_key) : api_key;
    return base_url_ + "/check-api-key?api_key=" + key;
}

std::string GalleryClient::upload_url(const std::string& event_code) const {
    auto curl = make_handle();
    std::string code = curl ? escape(curl.get(), event_code) : event_code;
    return base_url_ + "/api/gallery/" + code + "/photos";
}

std::expected<HealthResponse, TransportError> GalleryClient::health_check(const std::string& api_key) {
    auto curl = make_handle();
    if (!curl) return std::unexpected(transport_error("curl_easy_init failed"));

    const std::string url = health_url(api_key);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

    std::string body;
    auto status = perform(curl.get(), body);
    if (!status) return std::unexpected(status.error());

    return parse_health_response(*status, body);
}

std::expected<UploadResponse, TransportError> GalleryClient::upload(
    const std::string& event_code,
    const std::filesystem::path& file_path,
    const std::string& api_key
) {
    const std::string file_name = file_path.filename().string();
    if (file_name.empty()) {
        return std::unexpected(TransportError{TransportError::Kind::FileIo, "Invalid file path"});
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        return std::unexpected(TransportError{TransportError::Kind::FileIo,
                                              "Cannot open " + file_path.string()});
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(TransportError{TransportError::Kind::FileIo,
                                              "Cannot read " + file_path.string()});
    }

    auto curl = make_handle();
    if (!curl) return std::unexpected(transport_error("curl_easy_init failed"));

    MimePtr form(curl_mime_init(curl.get()), curl_mime_free);
    if (!form) return std::unexpected(transport_error("curl_mime_init failed"));

    curl_mimepart* part = curl_mime_addpart(form.get());
    curl_mime_name(part, "original_file");
    curl_mime_data(part, content.data(), content.size());
    curl_mime_filename(part, file_name.c_str());
    curl_mime_type(part, mime_type_for(file_path).c_str());

    const std::string local_path = file_path.string();
    const std::string shot_at = rfc3339_utc(std::chrono::system_clock::now());

    auto add_text = [&](const char* name, const std::string& value) {
        curl_mimepart* p = curl_mime_addpart(form.get());
        curl_mime_name(p, name);
        curl_mime_data(p, value.c_str(), CURL_ZERO_TERMINATED);
    };
    add_text("api_key", api_key);
    add_text("original_name", file_name);
    add_text("local_path", local_path);
    add_text("shot_at", shot_at);

    const std::string url = upload_url(event_code);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, form.get());

    std::string body;
    auto status = perform(curl.get(), body);
    if (!status) return std::unexpected(status.error());

    return parse_upload_response(*status, body);
}

} // namespace perch
