#include "inflight_fetches.hpp"
#include "log.hpp"
#include <exception>
#include <optional>

namespace blackhole {

std::string InflightFetches::run(const std::string& key, const std::function<std::string()>& fill) {
    std::promise<std::string> promise;
    std::optional<std::shared_future<std::string>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inflight_.find(key);
        if (it != inflight_.end()) {
            running = it->second;
        } else {
            inflight_.emplace(key, promise.get_future().share());
        }
    }

    if (running) {
        log_debug("Inflight", "Waiting on fetch already running for " + key);
        return running->get();
    }

    std::string result;
    try {
        result = fill();
    } catch (...) {
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_.erase(key);
        throw;
    }

    promise.set_value(result);
    std::lock_guard<std::mutex> lock(mutex_);
    inflight_.erase(key);
    return result;
}

size_t InflightFetches::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_.size();
}

} // namespace blackhole
