#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace bme {

std::string hex(const std::vector<uint8_t>& v);
std::string hex(const uint8_t* p, size_t n);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// Reads a whole file. Returns false if it cannot be opened.
bool read_file_all(const std::string& path, std::string& out);

// Crash-safe replace: write to a unique temp file, fsync, keep the previous
// version as <path>.bak, then rename over <path>. Creates parent directories.
// With owner_only the file and its backup are mode 0600 on POSIX.
bool atomic_write_file(const std::string& path, const std::string& contents, std::string& err,
                       bool owner_only = false);

} // namespace bme
