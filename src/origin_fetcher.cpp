#include "origin_fetcher.hpp"
#include "config.hpp"
#include "log.hpp"
#include <curl/curl.h>

namespace blackhole {

// CURL write callback for collecting response data into a string.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string origin_url(const RemoteAsset& asset, const std::string& origin_base) {
    return origin_base + "/" + asset.package + "@" + asset.version + "/" + asset.file;
}

CurlOriginFetcher::CurlOriginFetcher(long timeout_seconds, std::string origin_base)
    : timeout_seconds_(timeout_seconds), origin_base_(std::move(origin_base)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlOriginFetcher::~CurlOriginFetcher() {
    curl_global_cleanup();
}

std::string CurlOriginFetcher::fetch(const RemoteAsset& asset) {
    const std::string url = origin_url(asset, origin_base_);
    log_info("Origin", "GET " + url);

    CURL* curl = curl_easy_init();
    if (!curl) {
        log_error("Origin", "Failed to initialize CURL");
        throw FetchError("Failed to initialize CURL", url, 0);
    }

    std::string response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    // unpkg answers loose versions ("vue@3") with a redirect to the exact one.
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, FETCH_CONNECT_TIMEOUT_SECONDS);
    // Required when timeouts are used from multiple threads.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (log_enabled(LogLevel::Trace)) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::string cause = error_buffer[0] ? std::string(error_buffer) : curl_easy_strerror(res);
        log_error("Origin", "GET " + url + " failed: " + cause);
        throw FetchError("Download failed: " + cause, url, 0);
    }

    if (http_code < 200 || http_code >= 300) {
        log_error("Origin", "GET " + url + " returned HTTP " + std::to_string(http_code));
        throw FetchError("Origin returned HTTP " + std::to_string(http_code), url, http_code);
    }

    log_debug("Origin", "HTTP " + std::to_string(http_code) + " - " +
                            std::to_string(response.size()) + " bytes from " + url);
    return response;
}

} // namespace blackhole
