#include "request_handler.hpp"
#include "content_type.hpp"
#include "log.hpp"
#include <filesystem>
#include <variant>

namespace fs = std::filesystem;

namespace blackhole {

constexpr const char* INDEX_CONTENT_TYPE = "text/html; charset=utf-8";

// Builds a plain-text error response.
static Response error_response(int status, const std::string& message) {
    Response res;
    res.status = status;
    res.body = message;
    res.content_type = "text/plain";
    return res;
}

static Response ok_response(std::string body, const std::string& filename) {
    Response res;
    res.status = 200;
    res.body = std::move(body);
    res.content_type = content_type_for(filename);
    return res;
}

RequestHandler::RequestHandler(const Settings& settings, OriginFetcher& fetcher)
    : settings_(settings), fetcher_(fetcher), cache_(settings.proxy.cache_dir) {}

Response RequestHandler::handle(const std::string& path) {
    Classification c = classify(path);

    if (auto* bad = std::get_if<MalformedRequest>(&c)) {
        log_warn("Request", "Malformed request: " + bad->reason);
        return error_response(400, "Bad request: " + bad->reason);
    }
    if (auto* local = std::get_if<LocalAsset>(&c)) {
        return serve_local(*local);
    }
    return serve_remote(std::get<RemoteAsset>(c));
}

Response RequestHandler::serve_local(const LocalAsset& asset) {
    if (!is_safe_path(asset.name)) {
        log_warn("Local", "Rejected unsafe path: " + asset.name);
        return error_response(403, "Forbidden: unsafe path");
    }

    fs::path file = fs::path(settings_.proxy.static_dir) / asset.name;
    if (!is_within_root(settings_.proxy.static_dir, file)) {
        log_warn("Local", "Rejected path outside static dir: " + file.string());
        return error_response(403, "Forbidden: outside allowed directory");
    }
    log_debug("Local", "Looking for " + file.string());

    try {
        auto content = read_file_bytes(file);
        if (!content) {
            log_warn("Local", "File not found: " + asset.name);
            return error_response(404, "File not found: " + asset.name);
        }
        log_info("Local", "Served " + asset.name);
        return ok_response(std::move(*content), asset.name);
    } catch (const StorageError& e) {
        log_error("Local", e.what());
        return error_response(500, "Failed to read file: " + asset.name);
    }
}

Response RequestHandler::serve_remote(const RemoteAsset& asset) {
    // Proxy off: every package path is not found.
    if (!settings_.proxy.enabled) {
        log_debug("Remote", "Proxy disabled, not serving " + asset.key());
        return error_response(404, "Not found: proxy service not enabled");
    }

    if (!is_safe_path(asset.package) || !is_safe_path(asset.version) || !is_safe_path(asset.file)) {
        log_warn("Remote", "Rejected unsafe path: " + asset.key());
        return error_response(403, "Forbidden: unsafe path");
    }
    if (!cache_.contains(asset)) {
        log_warn("Remote", "Rejected path outside cache dir: " + cache_.path_for(asset).string());
        return error_response(403, "Forbidden: outside allowed directory");
    }

    try {
        if (auto cached = cache_.read(asset)) {
            log_info("Remote", "Cache hit: " + asset.key());
            return ok_response(std::move(*cached), asset.file);
        }

        log_info("Remote", "Cache miss: " + asset.key());
        std::string bytes = inflight_.run(asset.key(), [this, &asset]() { return fill(asset); });
        return ok_response(std::move(bytes), asset.file);
    } catch (const FetchError& e) {
        log_error("Remote", std::string(e.what()) + " (" + e.url() + ")");
        return error_response(502, "Bad gateway: " + std::string(e.what()));
    } catch (const StorageError& e) {
        log_error("Remote", e.what());
        return error_response(500, "Failed to read cached file: " + asset.key());
    }
}

std::string RequestHandler::fill(const RemoteAsset& asset) {
    // A fill that finished just before this one started has already stored it.
    if (auto cached = cache_.read(asset)) {
        return std::move(*cached);
    }

    std::string bytes = fetcher_.fetch(asset);

    try {
        cache_.write(asset, bytes);
        log_info("Remote", "Downloaded and cached " + asset.key() +
                               " (" + std::to_string(bytes.size()) + " bytes)");
    } catch (const StorageError& e) {
        log_warn("Remote", std::string("Failed to save cache file: ") + e.what());
    }
    return bytes;
}

Response RequestHandler::handle_index() {
    std::lock_guard<std::mutex> lock(index_mutex_);

    if (index_page_) {
        log_debug("Index", "Using cached index page");
        Response res;
        res.body = *index_page_;
        res.content_type = INDEX_CONTENT_TYPE;
        return res;
    }

    const std::string& path = settings_.server.index_file;
    try {
        auto content = read_file_bytes(path);
        if (!content) {
            log_error("Index", "Index page not found: " + path);
            return error_response(404, "404 - index page not found");
        }
        index_page_ = std::move(*content);
        log_info("Index", "Read and cached index page " + path);
    } catch (const StorageError& e) {
        log_error("Index", e.what());
        return error_response(500, "Failed to read index page");
    }

    Response res;
    res.body = *index_page_;
    res.content_type = INDEX_CONTENT_TYPE;
    return res;
}

} // namespace blackhole
