#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include <core/time_utils.hpp>

namespace fs = std::filesystem;

// A celestial body someone asked to echo off, waiting for its deadline.
// Timestamps are "YYYY-MM-DD HH:MM:SS" UTC.
struct Event {
    int id = 0;
    int64_t tweet_id = 0;
    std::string celestial_body;
    bool replied = false;
    std::string deadline;
    std::string created_at;
    std::string updated_at;
    double round_trip = 0.0;        // seconds
};

struct EventForm {
    int64_t tweet_id = 0;
    std::string celestial_body;
    TimePoint deadline;
    double round_trip = 0.0;
};

class EventStore {
public:
    explicit EventStore(const fs::path& path);

    // A missing or corrupt file loads as an empty store.
    std::vector<Event> load() const;
    Result<void> save(const std::vector<Event>& events) const;

    // Returns the new event's id.
    Result<int> insert(const EventForm& form);

    // Highest tweet id seen so far, 0 when empty.
    int64_t max_tweet_id() const;

    // Unreplied events whose deadline is at or before `now`.
    std::vector<Event> due(TimePoint now) const;

    Result<void> mark_replied(int id);

private:
    fs::path path_;
};
