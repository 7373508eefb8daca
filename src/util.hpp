#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace engram {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Format epoch seconds as ISO 8601 (UTC)
std::string format_timestamp(uint64_t epoch);

// Parse "YYYY-MM-DDTHH:MM:SS[.ffffff][Z]" as UTC. Returns nullopt on malformed input.
std::optional<uint64_t> parse_timestamp(const std::string& iso);

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Days as seconds, saturating at UINT64_MAX
uint64_t days_to_seconds(uint64_t days);

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Lowercased alphanumeric tokens
std::vector<std::string> tokenize(const std::string& s);

// Time-ordered ID: <prefix>_<YYYYmmdd_HHMMSS_micros>_<4 hex>. Thread-safe.
std::string generate_time_id(const std::string& prefix);

// Truncate to at most max_len bytes without splitting a UTF-8 character
std::string truncate(const std::string& s, size_t max_len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace engram
