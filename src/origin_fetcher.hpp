#pragma once

/**
 * Retrieval of package assets from the origin CDN.
 *
 * OriginFetcher is the seam RequestHandler depends on; CurlOriginFetcher
 * is the libcurl implementation used by the server.
 */

#include "config.hpp"
#include "path_classifier.hpp"
#include <stdexcept>
#include <string>

namespace blackhole {

/**
 * Raised when an origin fetch fails.
 *
 * status is the final HTTP status, or 0 when the transfer itself failed
 * (DNS, connect, TLS, timeout).
 */
class FetchError : public std::runtime_error {
public:
    FetchError(const std::string& message, std::string url, long status)
        : std::runtime_error(message), url_(std::move(url)), status_(status) {}

    const std::string& url() const { return url_; }
    long status() const { return status_; }

private:
    std::string url_;
    long status_;
};

// Returns "<origin>/<package>@<version>/<file>".
std::string origin_url(const RemoteAsset& asset, const std::string& origin_base);

/**
 * Interface for fetching a remote asset's bytes.
 */
class OriginFetcher {
public:
    virtual ~OriginFetcher() = default;

    /**
     * Fetches the full body of the asset.
     * Throws FetchError on a non-2xx status or a transport failure.
     * Never retries.
     */
    virtual std::string fetch(const RemoteAsset& asset) = 0;
};

/**
 * Blocking libcurl fetcher with a bounded total timeout.
 *
 * Each call uses its own easy handle, so one instance can serve
 * concurrent request threads.
 */
class CurlOriginFetcher : public OriginFetcher {
public:
    explicit CurlOriginFetcher(long timeout_seconds, std::string origin_base = ORIGIN_BASE);

    // Cleans up CURL global state.
    ~CurlOriginFetcher() override;

    CurlOriginFetcher(const CurlOriginFetcher&) = delete;
    CurlOriginFetcher& operator=(const CurlOriginFetcher&) = delete;

    std::string fetch(const RemoteAsset& asset) override;

private:
    long timeout_seconds_;     // CURLOPT_TIMEOUT for the whole transfer.
    std::string origin_base_;  // Scheme and host, no trailing slash.
};

} // namespace blackhole
