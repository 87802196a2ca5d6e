#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace engram {

// Calendar date (YYYY-MM-DD) for the given epoch seconds (UTC)
std::string format_date(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Join strings with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Truncate to at most max_bytes without splitting a UTF-8 sequence.
// Appends suffix when truncation happened (suffix counts toward max_bytes).
std::string truncate_utf8(const std::string& s, size_t max_bytes,
                          const std::string& suffix = "");

// Estimate token count from text (~4 chars per token, rounded up)
uint32_t estimate_tokens(const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write file contents via temp file + rename. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& contents);

} // namespace engram
