#pragma once

/**
 * Request orchestration for /static/ paths.
 *
 * Classifies the path, then serves a local file or a cached remote asset,
 * filling the cache from the origin on a miss. Every failure becomes a
 * Response; nothing is retried and no exception escapes handle().
 */

#include "cache_store.hpp"
#include "inflight_fetches.hpp"
#include "origin_fetcher.hpp"
#include "path_classifier.hpp"
#include "settings.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace blackhole {

/**
 * Transport-independent result of handling one request.
 */
struct Response {
    int status = 200;
    std::string body;
    std::string content_type;
};

/**
 * Handles static asset requests. One instance is shared by all request
 * threads; settings and fetcher must outlive it.
 */
class RequestHandler {
public:
    RequestHandler(const Settings& settings, OriginFetcher& fetcher);

    // Non-copyable
    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    // Handles the path that follows /static/.
    Response handle(const std::string& path);

    // Serves the index page, reading it from disk only once.
    Response handle_index();

    const CacheStore& cache() const { return cache_; }

private:
    Response serve_local(const LocalAsset& asset);
    Response serve_remote(const RemoteAsset& asset);

    // Fetches from the origin and stores the result. A failed store is
    // logged and the fetched bytes are still returned.
    std::string fill(const RemoteAsset& asset);

    const Settings& settings_;
    OriginFetcher& fetcher_;
    CacheStore cache_;
    InflightFetches inflight_;

    std::mutex index_mutex_;
    std::optional<std::string> index_page_;  // Memoised after first read.
};

} // namespace blackhole
