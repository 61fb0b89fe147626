#pragma once

#include <filesystem>
#include <string>

// Content type for a file name, by extension (case-insensitive).
// Falls back to application/octet-stream.
std::string mime_type_for(const std::filesystem::path& path);
