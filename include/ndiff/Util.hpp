#ifndef NDIFF_UTIL_HPP
#define NDIFF_UTIL_HPP

#include <optional>
#include <string>
#include <vector>

namespace ndiff {

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);

// Split on delim, trimming each token and dropping empty ones
std::vector<std::string> split(const std::string& s, char delim);

// Parse a boolean flag: true/false, yes/no, on/off, 1/0 (case-insensitive).
// Returns nullopt for anything else.
std::optional<bool> parse_flag(const std::string& s);

} // namespace ndiff

#endif // NDIFF_UTIL_HPP
