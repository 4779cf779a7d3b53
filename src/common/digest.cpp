//
// Created by cv2 on 05.10.2026.
//

#include "digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/buffer.h>
#include <openssl/bio.h>
#include <fstream>
#include <format>
#include <memory>

namespace perch::digest {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const char* error_name(Error e) {
    switch (e) {
        case Error::OpenFailed: return "open failed";
        case Error::ReadFailed: return "read failed";
        case Error::DigestFailed: return "digest failed";
        case Error::RandomFailed: return "random source failed";
    }
    return "unknown";
}

std::string to_hex(const Bytes& data) {
    std::string s;
    s.reserve(data.size() * 2);
    for (auto b : data) s += std::format("{:02x}", b);
    return s;
}

static std::expected<std::string, Error> finish(EVP_MD_CTX* ctx) {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &len) <= 0) return std::unexpected(Error::DigestFailed);
    out.resize(len);
    return to_hex(out);
}

std::expected<std::string, Error> sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::unexpected(Error::OpenFailed);

    EvpMdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) <= 0)
        return std::unexpected(Error::DigestFailed);

    char buffer[64 * 1024];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) <= 0)
            return std::unexpected(Error::DigestFailed);
        if (file.eof()) break;
    }
    if (file.bad()) return std::unexpected(Error::ReadFailed);

    return finish(ctx.get());
}

std::expected<std::string, Error> sha256_hex(const Bytes& data) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) <= 0)
        return std::unexpected(Error::DigestFailed);
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) <= 0)
        return std::unexpected(Error::DigestFailed);
    return finish(ctx.get());
}

std::expected<std::string, Error> random_uuid() {
    Bytes raw(16);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1)
        return std::unexpected(Error::RandomFailed);

    raw[6] = static_cast<uint8_t>((raw[6] & 0x0f) | 0x40); // version 4
    raw[8] = static_cast<uint8_t>((raw[8] & 0x3f) | 0x80); // variant 10xx

    std::string hex = to_hex(raw);
    return std::format("{}-{}-{}-{}-{}",
                       hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
                       hex.substr(16, 4), hex.substr(20, 12));
}

std::string base64_encode(const unsigned char* data, size_t input_length) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    BIO_push(b64, mem);

    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64, data, static_cast<int>(input_length));
    BIO_flush(b64);

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);

    std::string result(bptr->data, bptr->length);

    BIO_free_all(b64);
    return result;
}

} // namespace perch::digest
