#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <core/config.hpp>
#include <telnet/channel.hpp>
#include <telnet/expect.hpp>
#include "dialogue.hpp"
#include "observer_table.hpp"

// Drives one observer-table query through the HORIZONS dialogue. The session
// opens its own channel per run() and closes it on every exit path; nothing
// carries over between runs.
class HorizonsSession {
public:
    explicit HorizonsSession(SessionConfig config,
                             ChannelOpener opener = open_default_channel());

    ObserverTableResult run(const ObserverTableRequest& request);

    // Safe to call from another thread or a signal handler. The pending
    // wait returns and run() fails with FailureKind::Cancelled. A request
    // made before run() cancels that run; it never outlives it.
    void cancel() { cancel_requested_.store(true); }

    static ChannelOpener open_default_channel();

private:
    SessionConfig config_;
    ChannelOpener opener_;
    const Dialogue& dialogue_;
    std::atomic<bool> cancel_requested_{false};

    ObserverTableResult run_dialogue(const ObserverTableRequest& request);

    // Send `input` (when present) and wait for one of the phase's prompts.
    MatchResult step(Channel& channel, ExpectMatcher& matcher,
                     SessionPhase phase, const std::optional<std::string>& input);

    ObserverTableResult fail_from_match(SessionPhase phase, const MatchResult& m) const;
};
