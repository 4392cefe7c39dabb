#pragma once

#include <atomic>
#include <string>
#include <core/config.hpp>
#include <horizons/observer_table.hpp>
#include <horizons/session.hpp>

// Target with whitespace removed plus TABLE_FILE_EXTENSION.
std::string default_output_path(const std::string& target);

class QueryCLI {
public:
    explicit QueryCLI(Config config,
                      ChannelOpener opener = HorizonsSession::open_default_channel());

    // horizons_query <start_time> <target> [output_path]
    int run_query(const std::string& start_time, const std::string& target,
                  const std::string& output_path = "");

    // horizons_query track <tweet_id> <created_at> <mention text>
    int run_track(const std::string& tweet_id, const std::string& created_at,
                  const std::string& mention);

    // horizons_query due
    int run_due();

    // horizons_query replied <id>
    int run_replied(const std::string& id);

    // Cancels the query in flight, if any. Async-signal-safe.
    void cancel();

private:
    Config config_;
    ChannelOpener opener_;
    std::atomic<HorizonsSession*> active_{nullptr};

    ObserverTableResult query(const ObserverTableRequest& request);
    ObserverTableRequest make_request(const std::string& start_time,
                                      const std::string& target) const;
};
