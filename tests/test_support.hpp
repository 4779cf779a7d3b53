//
// Created by cv2 on 12.10.2026.
//

#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <fstream>
#include <iterator>
#include <filesystem>
#include <chrono>
#include <thread>
#include <atomic>
#include <algorithm>

#include "daemon/upload_transport.hpp"

namespace perch::test {

    namespace fs = std::filesystem;

    // Unique directory under the system temp dir, removed on destruction
    class TempDir {
    public:
        TempDir() {
            static std::atomic<int> counter{0};
            path_ = fs::temp_directory_path() /
                    ("perch_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                     "_" + std::to_string(counter++));
            fs::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const { return path_; }
        fs::path operator/(const std::string& name) const { return path_ / name; }

    private:
        fs::path path_;
    };

    inline void write_file(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Polls pred until it holds or the timeout expires
    inline bool wait_until(const std::function<bool()>& pred,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    // Scripted UploadTransport. Records every call; can hold uploads at a gate.
    class FakeTransport : public UploadTransport {
    public:
        struct Call {
            std::string event_code;
            fs::path path;
            std::string api_key;
        };

        using UploadScript = std::function<std::expected<UploadResponse, TransportError>(const Call&)>;

        FakeTransport() {
            script_ = [](const Call&) -> std::expected<UploadResponse, TransportError> {
                UploadResponse r;
                r.success = true;
                r.message = "Photo uploaded";
                r.photo_id = "photo-1";
                return r;
            };
        }

        void set_script(UploadScript script) {
            std::lock_guard lock(mutex_);
            script_ = std::move(script);
        }

        void fail_with(TransportError error) {
            set_script([error](const Call&) -> std::expected<UploadResponse, TransportError> {
                return std::unexpected(error);
            });
        }

        void set_health(std::expected<HealthResponse, TransportError> health) {
            std::lock_guard lock(mutex_);
            health_ = std::move(health);
        }

        // Uploads block inside upload() until release()
        void hold() {
            std::lock_guard lock(mutex_);
            held_ = true;
        }

        void release() {
            {
                std::lock_guard lock(mutex_);
                held_ = false;
            }
            cv_.notify_all();
        }

        std::expected<HealthResponse, TransportError> health_check(const std::string&) override {
            std::lock_guard lock(mutex_);
            return health_;
        }

        std::expected<UploadResponse, TransportError> upload(
            const std::string& event_code,
            const fs::path& file_path,
            const std::string& api_key
        ) override {
            Call call{event_code, file_path, api_key};
            UploadScript script;
            {
                std::unique_lock lock(mutex_);
                calls_.push_back(call);
                ++in_flight_;
                max_in_flight_ = std::max(max_in_flight_, in_flight_);
                cv_.wait(lock, [this] { return !held_; });
                script = script_;
            }
            auto result = script(call);
            {
                std::lock_guard lock(mutex_);
                --in_flight_;
            }
            return result;
        }

        std::vector<Call> calls() const {
            std::lock_guard lock(mutex_);
            return calls_;
        }

        size_t in_flight() const {
            std::lock_guard lock(mutex_);
            return in_flight_;
        }

        size_t max_in_flight() const {
            std::lock_guard lock(mutex_);
            return max_in_flight_;
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        UploadScript script_;
        std::expected<HealthResponse, TransportError> health_ =
            HealthResponse{true, "API key is valid", "2026-10-12T10:00:00Z"};
        bool held_ = false;
        std::vector<Call> calls_;
        size_t in_flight_ = 0;
        size_t max_in_flight_ = 0;
    };

} // namespace perch::test
