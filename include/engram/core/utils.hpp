#ifndef ENGRAM_CORE_UTILS_HPP
#define ENGRAM_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace engram {

// ============ Math utilities ============

template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

const int64_t MS_PER_DAY = 86400000LL;

void sleep_ms(int64_t milliseconds);

// Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// ISO 8601 (YYYY-MM-DDTHH:MM:SSZ) from unix milliseconds
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
std::vector<std::string> split(const std::string& s, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Collapses whitespace runs to one space, lowercases and trims.
// Two texts are "identical content" when their normalized forms match.
std::string normalize_text(const std::string& s);

// Reads a whole file; false when it cannot be opened
bool read_file(const std::string& path, std::string& out);

// ============ Path utilities ============

std::string dirname(const std::string& path);
bool path_exists(const std::string& path);
bool mkdir_p(const std::string& path);

// ============ Identifiers and hashing ============

// Random (version 4) UUID
std::string generate_uuid();

std::string sha256_hex(const std::string& data);

// 64-bit FNV-1a, stable across runs and platforms
uint64_t fnv1a_64(const std::string& data);

} // namespace engram

#endif // ENGRAM_CORE_UTILS_HPP
