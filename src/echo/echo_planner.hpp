#pragma once

#include <string>
#include <core/types.hpp>
#include <core/time_utils.hpp>

struct EchoPlan {
    double light_time_minutes = 0.0;    // one-way
    double round_trip_secs = 0.0;
    TimePoint deadline;
};

// Third whitespace-separated field of the first table line: the one-way
// light time in minutes for quantity code 21.
Result<double> parse_light_time_minutes(const std::string& table);

// When a signal sent at `created_at` would return from the body.
Result<EchoPlan> plan_echo(const std::string& table, TimePoint created_at);

// "Pick a number:" reply listing "<id>: <name>" per candidate row, capped at
// REPLY_MAX_CHARS. Rows that would overflow the cap are dropped.
Result<std::string> format_candidate_reply(const std::string& candidates);

// Reply for a body the service does not know.
std::string not_found_reply();

// Mention text with the bot handle stripped and surrounding space trimmed.
std::string mention_body(const std::string& text);
