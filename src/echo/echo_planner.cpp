#include "echo_planner.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>
#include <sstream>

Result<double> parse_light_time_minutes(const std::string& table) {
    std::string text = table;
    trim(text);

    std::istringstream lines(text);
    std::string line;
    if (text.empty() || !std::getline(lines, line)) {
        return Result<double>::Err("HORIZONS response missing distance line");
    }
    trim(line);

    auto fields = split_whitespace(line);
    if (fields.size() < 3) {
        return Result<double>::Err(fmt::format("Missing distance field: '{}'", line));
    }

    auto minutes = parse_double(fields[2]);
    if (!minutes) {
        return Result<double>::Err(fmt::format("Invalid distance field '{}' in '{}'", fields[2], line));
    }
    return Result<double>::Ok(*minutes);
}

Result<EchoPlan> plan_echo(const std::string& table, TimePoint created_at) {
    auto minutes = parse_light_time_minutes(table);
    if (minutes.is_err()) {
        return Result<EchoPlan>::Err(minutes.error);
    }

    EchoPlan plan;
    plan.light_time_minutes = minutes.value;
    plan.round_trip_secs = minutes.value * 60.0 * 2.0;
    auto travel = std::chrono::milliseconds(static_cast<long long>(plan.round_trip_secs * 1000.0));
    plan.deadline = created_at + std::chrono::duration_cast<TimePoint::duration>(travel);
    return Result<EchoPlan>::Ok(plan);
}

Result<std::string> format_candidate_reply(const std::string& candidates) {
    static const std::regex row_pattern(R"( *(-?\d+) *(.*?)(\(|  |$))");

    std::string text = candidates;
    trim(text);

    std::string message = "Pick a number:\n";
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        std::smatch cap;
        if (!std::regex_search(line, cap, row_pattern)) {
            return Result<std::string>::Err(fmt::format("No match found in '{}'", line));
        }
        std::string name = cap[2].str();
        trim(name);
        std::string entry = fmt::format("{}: {}\n", cap[1].str(), name);
        if (message.size() + entry.size() <= REPLY_MAX_CHARS) {
            message += entry;
        }
    }
    return Result<std::string>::Ok(message);
}

std::string not_found_reply() {
    return "Sorry, I don't recognize that location.\n"
           "\n"
           "Consult JPL HORIZONS for valid options: https://ssd.jpl.nasa.gov/?horizons\n";
}

std::string mention_body(const std::string& text) {
    std::string body = text;
    trim(body);
    std::string handle = MENTION_HANDLE;
    if (body.rfind(handle, 0) == 0) {
        body = body.substr(handle.size());
        trim(body);
    }
    return body;
}
