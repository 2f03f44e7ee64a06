#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace memvault {

// Unix epoch milliseconds (record timestamps use this resolution)
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a random RFC 4122 version 4 UUID string
std::string generate_id();

// Length in characters (UTF-8 code points), not bytes
size_t utf8_length(const std::string& text);

// Shorten text to at most max_chars bytes, appending "..." when cut.
// Never splits a UTF-8 sequence.
std::string preview(const std::string& text, size_t max_chars);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write contents to a sibling temp file and rename it over path.
// Creates parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& contents);

// Read a whole file. Throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string& path);

} // namespace memvault
