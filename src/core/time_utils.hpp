#pragma once

#include <string>
#include <chrono>
#include <optional>

using TimePoint = std::chrono::system_clock::time_point;

// Parse a UTC timestamp "YYYY-MM-DD HH:MM:SS". "YYYY-MM-DD HH:MM" and the
// ISO 'T' separator are accepted too. Returns nullopt on parse failure.
std::optional<TimePoint> parse_timestamp(const std::string& text);

// Format as "YYYY-MM-DD HH:MM:SS" (UTC). Sub-second precision is dropped.
std::string format_timestamp(TimePoint tp);

// Human-readable duration like "2h35m", "14m22s", "8s".
std::string format_duration(std::chrono::seconds d);
