#include "settings.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <stdexcept>

namespace blackhole {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Returns the named object section, or an empty object if it is absent.
static json section(const json& j, const char* name) {
    if (!j.contains(name)) {
        return json::object();
    }
    const json& s = j.at(name);
    if (!s.is_object()) {
        throw std::runtime_error(std::string("Settings section '") + name + "' must be an object");
    }
    return s;
}

// Reads an integer field as a 64-bit value and range-checks it before the
// caller narrows it. Absent fields yield def.
static long long integer_field(const json& s, const std::string& name, const char* key,
                               long long def, long long lo, long long hi) {
    if (!s.contains(key)) {
        return def;
    }
    const json& v = s.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(name + " must be an integer");
    }
    bool in_range = v.is_number_unsigned()
        ? v.get<json::number_unsigned_t>() <= static_cast<json::number_unsigned_t>(hi) &&
              v.get<json::number_unsigned_t>() >= static_cast<json::number_unsigned_t>(lo)
        : v.get<json::number_integer_t>() >= lo && v.get<json::number_integer_t>() <= hi;
    if (!in_range) {
        throw std::runtime_error(name + " must be between " + std::to_string(lo) + " and " + std::to_string(hi));
    }
    return v.get<long long>();
}

static void validate(const Settings& settings) {
    if (settings.proxy.static_dir.empty() || settings.proxy.cache_dir.empty()) {
        throw std::runtime_error("proxy.static_dir and proxy.cache_dir must not be empty");
    }
}

std::optional<Settings> load_settings(const std::string& path) {
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open settings file: " + path);
    }

    Settings settings;
    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            throw std::runtime_error("Settings file must contain a JSON object: " + path);
        }

        json proxy = section(j, "proxy");
        settings.proxy.enabled = proxy.value("enabled", settings.proxy.enabled);
        settings.proxy.static_dir = proxy.value("static_dir", settings.proxy.static_dir);
        settings.proxy.cache_dir = proxy.value("cache_dir", settings.proxy.cache_dir);
        settings.proxy.fetch_timeout_seconds = static_cast<long>(integer_field(
            proxy, "proxy.fetch_timeout_seconds", "fetch_timeout_seconds",
            settings.proxy.fetch_timeout_seconds, 1, MAX_FETCH_TIMEOUT_SECONDS));

        json server = section(j, "server");
        settings.server.host = server.value("host", settings.server.host);
        settings.server.port = static_cast<int>(integer_field(
            server, "server.port", "port", settings.server.port, 1, 65535));
        settings.server.threads = static_cast<int>(integer_field(
            server, "server.threads", "threads", settings.server.threads, 1, MAX_THREADS));
        settings.server.index_file = server.value("index_file", settings.server.index_file);

        json log = section(j, "log");
        settings.log.enabled = log.value("enabled", settings.log.enabled);
        settings.log.level = log.value("level", settings.log.level);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid settings file " + path + ": " + e.what());
    }

    validate(settings);
    log_debug("Settings", "Loaded " + path);
    return settings;
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["proxy"] = {
        {"enabled", settings.proxy.enabled},
        {"static_dir", settings.proxy.static_dir},
        {"cache_dir", settings.proxy.cache_dir},
        {"fetch_timeout_seconds", settings.proxy.fetch_timeout_seconds}
    };
    j["server"] = {
        {"host", settings.server.host},
        {"port", settings.server.port},
        {"threads", settings.server.threads},
        {"index_file", settings.server.index_file}
    };
    j["log"] = {
        {"enabled", settings.log.enabled},
        {"level", settings.log.level}
    };

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write settings file: " + path);
    }
    file << j.dump(2) << std::endl;
    if (!file) {
        throw std::runtime_error("Failed writing settings file: " + path);
    }
}

void ensure_directories(const Settings& settings) {
    for (const auto& dir : {settings.proxy.static_dir, settings.proxy.cache_dir}) {
        // create_directories throws fs::filesystem_error on failure.
        if (fs::create_directories(dir)) {
            log_info("Settings", "Created directory " + dir);
        }
    }
}

} // namespace blackhole
