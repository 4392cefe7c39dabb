#pragma once

#include <string>
#include <vector>
#include <optional>

// Generate a "YYYY-MM-DD HH:MM:SS" UTC timestamp for the current time.
std::string now_timestamp();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict floating point parse: the whole string must be a number.
std::optional<double> parse_double(const std::string& s);

// Split on runs of whitespace, dropping empty fields.
std::vector<std::string> split_whitespace(const std::string& s);

// Copy of s with every whitespace character removed.
std::string strip_whitespace(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
