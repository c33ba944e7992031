#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace strata {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds (item timestamps)
uint64_t epoch_millis();

// ISO 8601 UTC timestamp for an epoch-milliseconds value
std::string iso_timestamp(uint64_t millis);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Case-insensitive substring test (ASCII folding)
bool contains_ci(const std::string& haystack, const std::string& needle);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_words(const std::string& s);

// Keep at most max_words whitespace-separated words; appends "..." when cut.
std::string truncate_words(const std::string& s, size_t max_words);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path via a temp file + rename. Creates parent dirs.
// Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace strata
