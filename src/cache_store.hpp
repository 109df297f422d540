#pragma once

/**
 * On-disk cache of remote package assets.
 *
 * Mirrors package/version/file under the cache root. Entries never expire;
 * presence of the file is the whole of the cache state.
 */

#include "path_classifier.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace blackhole {

// Raised when a cached or local file cannot be read or written.
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& message, std::filesystem::path path)
        : std::runtime_error(message), path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * Owns the cache directory tree. Nothing else writes under the root.
 *
 * Safe to share between request threads: writes land in a private
 * temporary file and are renamed into place, so exists() and read()
 * never see a partially written entry.
 */
class CacheStore {
public:
    explicit CacheStore(std::filesystem::path root);

    // Returns root/package/version/file.
    std::filesystem::path path_for(const RemoteAsset& asset) const;

    // Returns true if a regular file is cached for the asset.
    bool exists(const RemoteAsset& asset) const;

    // Returns the cached bytes, or nullopt if the asset is not cached.
    // Throws StorageError if the file exists but cannot be read.
    std::optional<std::string> read(const RemoteAsset& asset) const;

    // Stores bytes for the asset, creating parent directories as needed.
    // Throws StorageError on failure; no partial entry is left behind.
    void write(const RemoteAsset& asset, const std::string& bytes) const;

    // Returns true if path_for(asset) resolves, symlinks followed, inside the root.
    bool contains(const RemoteAsset& asset) const;

private:
    std::filesystem::path root_;
};

// Returns true if target, with symlinks resolved, lies inside root. A target
// that does not exist yet is judged by its existing ancestors.
bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& target);

// Reads a whole file. Returns nullopt if it is missing or not a regular file;
// throws StorageError on I/O failure.
std::optional<std::string> read_file_bytes(const std::filesystem::path& path);

} // namespace blackhole
