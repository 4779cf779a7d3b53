//
// Created by cv2 on 05.10.2026.
//

#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace perch::digest {

    using Bytes = std::vector<uint8_t>;

    enum class Error {
        OpenFailed,
        ReadFailed,
        DigestFailed,
        RandomFailed
    };

    const char* error_name(Error e);

    // SHA-256 of a file on disk, lowercase hex (64 chars)
    std::expected<std::string, Error> sha256_file(const std::filesystem::path& path);

    // SHA-256 of an in-memory buffer, lowercase hex
    std::expected<std::string, Error> sha256_hex(const Bytes& data);

    // RFC 4122 version 4 UUID from OpenSSL's CSPRNG
    std::expected<std::string, Error> random_uuid();

    std::string to_hex(const Bytes& data);

    std::string base64_encode(const unsigned char* data, size_t input_length);

} // namespace perch::digest
