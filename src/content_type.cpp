#include "content_type.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace blackhole {

static const std::unordered_map<std::string, std::string> MIME_TYPES = {
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},
    {".js", "application/javascript"},
    {".mjs", "application/javascript"},
    {".json", "application/json"},
    {".map", "application/json"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".ico", "image/x-icon"},
    {".webp", "image/webp"},
    {".woff", "font/woff"},
    {".woff2", "font/woff2"},
    {".ttf", "font/ttf"},
    {".otf", "font/otf"},
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".xml", "application/xml"},
    {".wasm", "application/wasm"}
};

std::string content_type_for(const std::string& filename) {
    // Only look at the last path component.
    auto slash_pos = filename.rfind('/');
    auto dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos ||
        (slash_pos != std::string::npos && dot_pos < slash_pos)) {
        return DEFAULT_CONTENT_TYPE;
    }

    std::string ext = filename.substr(dot_pos);
    // Convert to lowercase
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    auto it = MIME_TYPES.find(ext);
    if (it == MIME_TYPES.end()) {
        return DEFAULT_CONTENT_TYPE;
    }
    return it->second;
}

} // namespace blackhole
