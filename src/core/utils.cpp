#include "utils.hpp"
#include "time_utils.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <chrono>
#include <stdexcept>

std::string now_timestamp() {
    return format_timestamp(std::chrono::system_clock::now());
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return std::nullopt;
    return v;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> fields;
    std::istringstream ss(s);
    std::string field;
    while (ss >> field) fields.push_back(field);
    return fields;
}

std::string strip_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) out += c;
    }
    return out;
}
