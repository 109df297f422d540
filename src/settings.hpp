#pragma once

/**
 * Settings persistence for the blackhole server.
 *
 * Handles loading and saving of the JSON settings file. Settings are read
 * once at startup and passed by reference to the components that need them.
 */

#include "config.hpp"
#include <string>
#include <optional>

namespace blackhole {

/**
 * Remote proxy and on-disk layout settings.
 */
struct ProxySettings {
    bool enabled = false;                 // Serve package@version paths from the origin.
    std::string static_dir = DEFAULT_STATIC_DIR;  // Root for local assets.
    std::string cache_dir = DEFAULT_CACHE_DIR;    // Root for cached remote assets.
    long fetch_timeout_seconds = DEFAULT_FETCH_TIMEOUT_SECONDS;  // Upper bound on one origin fetch.
};

struct ServerSettings {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    int threads = DEFAULT_THREADS;                   // Request worker threads.
    std::string index_file = DEFAULT_INDEX_FILE;     // Page served at "/".
};

struct LogSettings {
    bool enabled = true;
    std::string level = "info";
};

/**
 * Application settings stored in blackhole.json.
 */
struct Settings {
    ProxySettings proxy;
    ServerSettings server;
    LogSettings log;
};

// Loads settings from the given file. Returns empty optional if the file
// doesn't exist. Throws std::runtime_error if the file is malformed.
std::optional<Settings> load_settings(const std::string& path);

// Saves settings to the given file. Throws std::runtime_error on failure.
void save_settings(const Settings& settings, const std::string& path);

// Creates the static and cache directories if they are missing.
void ensure_directories(const Settings& settings);

} // namespace blackhole
