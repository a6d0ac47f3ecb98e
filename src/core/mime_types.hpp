#pragma once

#include <filesystem>
#include <string>

// Content type for a file name, by extension (case-insensitive). Unknown
// extensions map to application/octet-stream.
std::string mime_type_for(const std::filesystem::path &path);
