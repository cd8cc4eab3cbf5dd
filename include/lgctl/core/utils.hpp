#ifndef lgctl_CORE_UTILS_HPP
#define lgctl_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace lgctl {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Monotonic clock in milliseconds, for deadlines
int64_t monotonic_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter. Empty fields are kept ("a..b" -> "a", "", "b").
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Parse a strictly positive decimal integer. Returns false on junk, sign or overflow.
bool parse_positive_int(const std::string& s, int& out);

// "true", "1", "yes", "on" (case-insensitive)
bool is_truthy(const std::string& s);

// ============ Path / file utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Create a directory and all of its parents
bool create_directories(const std::string& dir);

bool file_exists(const std::string& path);

bool read_file(const std::string& path, std::string& out);
bool write_file(const std::string& path, const std::string& content);

// Value of an environment variable, or `fallback` when unset or empty
std::string env_or(const char* name, const std::string& fallback);

// ============ Hashing utilities ============

// Lowercase hex SHA-256 digest of `data`
std::string sha256_hex(const std::string& data);

} // namespace lgctl

#endif // lgctl_CORE_UTILS_HPP
