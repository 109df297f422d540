#pragma once

/**
 * Per-key coalescing of concurrent cache fills.
 *
 * The first caller for a key runs the fill; callers arriving while it is
 * running wait for and share its result, including a thrown error.
 */

#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace blackhole {

class InflightFetches {
public:
    InflightFetches() = default;

    // Non-copyable
    InflightFetches(const InflightFetches&) = delete;
    InflightFetches& operator=(const InflightFetches&) = delete;

    // Returns fill()'s result for key, running fill at most once among
    // overlapping callers. Rethrows the leader's exception in every caller.
    std::string run(const std::string& key, const std::function<std::string()>& fill);

    // Number of keys currently being filled.
    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<std::string>> inflight_;
};

} // namespace blackhole
