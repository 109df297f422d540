#pragma once

#include <string>

namespace blackhole {

constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

// Gets the MIME type for a file based on its extension (case-insensitive).
// Unknown or missing extensions map to application/octet-stream.
std::string content_type_for(const std::string& filename);

} // namespace blackhole
