#pragma once
#include <string>
#include <vector>
#include <optional>

namespace patchkit {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Case-insensitive ASCII lowercase copy
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file. Returns nullopt if it cannot be opened.
std::optional<std::string> read_file(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates missing parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace patchkit
