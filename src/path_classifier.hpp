#pragma once

/**
 * Request path classification.
 *
 * Splits the path that follows /static/ into either a local asset name or
 * a versioned package asset (package@version/file) served from the origin.
 */

#include <string>
#include <variant>

namespace blackhole {

/**
 * A file served by name from the static directory.
 */
struct LocalAsset {
    std::string name;  // Relative path under the static root.
};

/**
 * A file inside a published package version.
 *
 * Scoped packages keep their scope in the package name, e.g. "@scope/pkg".
 */
struct RemoteAsset {
    std::string package;  // Package name, non-empty.
    std::string version;  // Version or tag, non-empty.
    std::string file;     // Path inside the package, may contain '/'.

    // Returns "package@version/file", used as the cache and in-flight key.
    std::string key() const {
        return package + "@" + version + "/" + file;
    }
};

// Path could not be parsed into either asset shape.
struct MalformedRequest {
    std::string reason;
};

using Classification = std::variant<LocalAsset, RemoteAsset, MalformedRequest>;

/**
 * Classifies a request path (without the /static/ prefix).
 *
 * The leading segment runs up to the first '/', or up to the second '/'
 * when the path starts with '@'. If that segment holds an '@' (other than
 * a scope marker), the last one separates package from version and the
 * rest of the path is the file. Otherwise the whole path is a local name.
 */
Classification classify(const std::string& path);

// Returns true if every '/'-separated component is non-empty and not "." or
// "..", and the path holds no backslash, NUL, or leading '/'.
bool is_safe_path(const std::string& path);

} // namespace blackhole
