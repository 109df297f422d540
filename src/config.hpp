#pragma once

/**
 * Application configuration constants.
 *
 * Defines the origin CDN, URL prefixes and built-in defaults for the
 * blackhole server.
 */

namespace blackhole {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = "blackhole.json";      // Default settings file.
constexpr const char* DEFAULT_STATIC_DIR = "./static";       // Local asset root.
constexpr const char* DEFAULT_CACHE_DIR = "./cache";         // Remote asset cache root.
constexpr const char* DEFAULT_INDEX_FILE = "ui/index.html";  // Page served at "/".

// ========== Server Defaults ==========

constexpr const char* DEFAULT_HOST = "localhost";
constexpr int DEFAULT_PORT = 8080;
constexpr int DEFAULT_THREADS = 8;
constexpr int MAX_THREADS = 1024;

// ========== Routes ==========

constexpr const char* STATIC_PREFIX = "/static/";  // Prefix routed into RequestHandler.

// ========== Origin ==========

constexpr const char* ORIGIN_BASE = "https://unpkg.com";  // Fixed upstream CDN.
constexpr long DEFAULT_FETCH_TIMEOUT_SECONDS = 30;       // Total transfer timeout.
constexpr long MAX_FETCH_TIMEOUT_SECONDS = 3600;
constexpr long FETCH_CONNECT_TIMEOUT_SECONDS = 10;
constexpr const char* USER_AGENT = "blackhole/1.0";

} // namespace blackhole
