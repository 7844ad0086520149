#pragma once

#include <string>
#include <vector>
#include <optional>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Decode standard base64 (padding optional, whitespace ignored).
// Returns nullopt on an invalid character.
std::optional<std::string> base64_decode(const std::string& input);

// Join non-empty parts with a separator.
std::string join_nonempty(const std::vector<std::string>& parts, const std::string& sep = " ");

// Replace every occurrence of `from` in `s`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Single-quote a value for a POSIX shell.
std::string shell_quote(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
