#pragma once

#include "log.hpp"
#include "origin_fetcher.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace blackhole::testing {

namespace fs = std::filesystem;

// Creates a unique directory under the system temp dir and removes it on scope exit.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("blackhole_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        fs::create_directories(path_);
        set_log_level(LogLevel::Off);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Fetcher double: serves canned bodies by key and counts calls.
class FakeFetcher : public OriginFetcher {
public:
    std::string fetch(const RemoteAsset& asset) override {
        ++calls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        std::string url = origin_url(asset, "https://unpkg.com");
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bodies.find(asset.key());
        if (it == bodies.end()) {
            throw FetchError("Origin returned HTTP " + std::to_string(fail_status), url, fail_status);
        }
        return it->second;
    }

    std::map<std::string, std::string> bodies;  // key() -> body
    long fail_status = 404;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};

private:
    std::mutex mutex_;
};

} // namespace blackhole::testing
