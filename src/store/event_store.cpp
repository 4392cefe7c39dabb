#include "event_store.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

EventStore::EventStore(const fs::path& path) : path_(path) {}

std::vector<Event> EventStore::load() const {
    std::vector<Event> events;

    if (!fs::exists(path_)) {
        return events;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());

        if (root["events"] && root["events"].IsSequence()) {
            for (const auto& n : root["events"]) {
                Event e;
                e.id = n["id"].as<int>(0);
                e.tweet_id = n["tweet_id"].as<int64_t>(0);
                e.celestial_body = n["celestial_body"].as<std::string>("");
                e.replied = n["replied"].as<bool>(false);
                e.deadline = n["deadline"].as<std::string>("");
                e.created_at = n["created_at"].as<std::string>("");
                e.updated_at = n["updated_at"].as<std::string>("");
                e.round_trip = n["round_trip"].as<double>(0.0);
                events.push_back(e);
            }
        }
    } catch (const std::exception&) {
        // Corrupted store file, start fresh
        return {};
    }

    return events;
}

Result<void> EventStore::save(const std::vector<Event>& events) const {
    try {
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "events" << YAML::Value << YAML::BeginSeq;
        for (const auto& e : events) {
            out << YAML::BeginMap;
            out << YAML::Key << "id" << YAML::Value << e.id;
            out << YAML::Key << "tweet_id" << YAML::Value << e.tweet_id;
            out << YAML::Key << "celestial_body" << YAML::Value << e.celestial_body;
            out << YAML::Key << "replied" << YAML::Value << e.replied;
            out << YAML::Key << "deadline" << YAML::Value << e.deadline;
            out << YAML::Key << "created_at" << YAML::Value << e.created_at;
            out << YAML::Key << "updated_at" << YAML::Value << e.updated_at;
            out << YAML::Key << "round_trip" << YAML::Value << e.round_trip;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        std::ofstream fout(path_.string());
        if (!fout) {
            return Result<void>::Err("Failed to write event store at " + path_.string());
        }
        fout << out.c_str();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to save event store: ") + e.what());
    }
}

Result<int> EventStore::insert(const EventForm& form) {
    auto events = load();

    int next_id = 1;
    for (const auto& e : events) {
        next_id = std::max(next_id, e.id + 1);
    }

    Event e;
    e.id = next_id;
    e.tweet_id = form.tweet_id;
    e.celestial_body = form.celestial_body;
    e.replied = false;
    e.deadline = format_timestamp(form.deadline);
    e.created_at = now_timestamp();
    e.updated_at = e.created_at;
    e.round_trip = form.round_trip;
    events.push_back(e);

    auto saved = save(events);
    if (saved.is_err()) {
        return Result<int>::Err(saved.error);
    }
    return Result<int>::Ok(next_id);
}

int64_t EventStore::max_tweet_id() const {
    int64_t max_id = 0;
    for (const auto& e : load()) {
        max_id = std::max(max_id, e.tweet_id);
    }
    return max_id;
}

std::vector<Event> EventStore::due(TimePoint now) const {
    std::vector<Event> out;
    for (const auto& e : load()) {
        if (e.replied) continue;
        auto deadline = parse_timestamp(e.deadline);
        if (deadline && *deadline <= now) {
            out.push_back(e);
        }
    }
    return out;
}

Result<void> EventStore::mark_replied(int id) {
    auto events = load();
    auto it = std::find_if(events.begin(), events.end(),
                           [id](const Event& e) { return e.id == id; });
    if (it == events.end()) {
        return Result<void>::Err(fmt::format("No event with id {}", id));
    }
    it->replied = true;
    it->updated_at = now_timestamp();
    return save(events);
}
