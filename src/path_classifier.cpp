#include "path_classifier.hpp"

namespace blackhole {

Classification classify(const std::string& path) {
    if (path.empty()) {
        return MalformedRequest{"empty path"};
    }

    bool scoped = path[0] == '@';

    // Leading segment: first component, or the first two for "@scope/pkg".
    size_t lead_end = path.find('/');
    if (scoped && lead_end != std::string::npos) {
        lead_end = path.find('/', lead_end + 1);
    }
    std::string lead = path.substr(0, lead_end);

    size_t at = lead.rfind('@');
    if (at == std::string::npos || (scoped && at == 0)) {
        if (scoped) {
            return MalformedRequest{"scoped package without version: " + path};
        }
        return LocalAsset{path};
    }

    RemoteAsset asset;
    asset.package = lead.substr(0, at);
    asset.version = lead.substr(at + 1);
    if (lead_end != std::string::npos) {
        asset.file = path.substr(lead_end + 1);
    }

    if (asset.package.empty()) {
        return MalformedRequest{"missing package name: " + path};
    }
    if (scoped) {
        // "@scope/name": both halves non-empty.
        size_t slash = asset.package.find('/');
        if (slash == std::string::npos || slash == 1 || slash == asset.package.size() - 1) {
            return MalformedRequest{"invalid scoped package name: " + path};
        }
    }
    if (asset.version.empty()) {
        return MalformedRequest{"missing version: " + path};
    }
    if (asset.file.empty()) {
        return MalformedRequest{"missing file path: " + path};
    }
    return asset;
}

bool is_safe_path(const std::string& path) {
    if (path.empty() || path[0] == '/') {
        return false;
    }
    if (path.find('\\') != std::string::npos || path.find('\0') != std::string::npos) {
        return false;
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string component = path.substr(start, end - start);
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

} // namespace blackhole
