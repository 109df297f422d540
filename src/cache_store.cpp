#include "cache_store.hpp"
#include "log.hpp"
#include <atomic>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace blackhole {

// Distinguishes temp files of concurrent writers within this process.
static std::atomic<unsigned long> g_temp_counter{0};

std::optional<std::string> read_file_bytes(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError("open failed: " + path.string(), path);
    }

    std::string bytes;
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) {
        throw StorageError("size query failed: " + path.string(), path);
    }
    bytes.resize(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!in) {
        throw StorageError("read failed: " + path.string(), path);
    }
    return bytes;
}

bool is_within_root(const fs::path& root, const fs::path& target) {
    std::error_code ec;
    fs::path resolved_root = fs::weakly_canonical(root, ec);
    if (ec) {
        return false;
    }
    // "dir/" keeps a trailing empty component.
    if (resolved_root.filename().empty()) {
        resolved_root = resolved_root.parent_path();
    }
    fs::path resolved_target = fs::weakly_canonical(target, ec);
    if (ec) {
        return false;
    }

    auto t = resolved_target.begin();
    for (const auto& part : resolved_root) {
        if (t == resolved_target.end() || part != *t) {
            return false;
        }
        ++t;
    }
    return true;
}

CacheStore::CacheStore(fs::path root) : root_(std::move(root)) {}

fs::path CacheStore::path_for(const RemoteAsset& asset) const {
    return root_ / asset.package / asset.version / asset.file;
}

bool CacheStore::exists(const RemoteAsset& asset) const {
    std::error_code ec;
    return fs::is_regular_file(path_for(asset), ec);
}

bool CacheStore::contains(const RemoteAsset& asset) const {
    return is_within_root(root_, path_for(asset));
}

std::optional<std::string> CacheStore::read(const RemoteAsset& asset) const {
    return read_file_bytes(path_for(asset));
}

void CacheStore::write(const RemoteAsset& asset, const std::string& bytes) const {
    const fs::path target = path_for(asset);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError("mkdir failed: " + target.parent_path().string() + ": " + ec.message(), target);
    }

    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_temp_counter.fetch_add(1));

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError("open failed: " + tmp.string(), target);
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw StorageError("write failed: " + tmp.string(), target);
        }
    }

    fs::rename(tmp, target, ec);  // atomic on same filesystem
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StorageError("rename failed: " + target.string() + ": " + ec.message(), target);
    }

    log_debug("Cache", "Stored " + target.string() + " (" + std::to_string(bytes.size()) + " bytes)");
}

} // namespace blackhole
