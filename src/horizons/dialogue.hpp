#pragma once

#include <map>
#include <string>
#include <vector>
#include <telnet/expect.hpp>
#include "observer_table.hpp"
#include "session_phase.hpp"

// What to send after a prompt matched.
enum class ReplyKind {
    None,
    Literal,
    Target,
    StartTime,
    StepSize,
    QuantityCode,
};

enum class ActionKind {
    Send,                   // send the reply, move to `next`
    Fail,                   // terminate with `failure`
    SynthesizeDisallowed,   // terminate successfully with a placeholder line
    ExtractTable,           // take the marker payload, send the reply, terminate
};

struct Transition {
    std::string label;
    Pattern pattern;
    ActionKind action;
    ReplyKind reply = ReplyKind::None;
    std::string literal;
    SessionPhase next = SessionPhase::Failed;
    FailureKind failure = FailureKind::None;
};

// Phase -> ordered transitions. The order of a phase's transitions is the
// order its patterns are tried in.
class Dialogue {
public:
    // The observer-table workflow of the HORIZONS telnet interface.
    static const Dialogue& horizons();

    // Throws std::out_of_range for Done and Failed.
    const std::vector<Transition>& transitions(SessionPhase phase) const;
    std::vector<Pattern> patterns(SessionPhase phase) const;

private:
    std::map<SessionPhase, std::vector<Transition>> table_;

    Dialogue();
};

// Text to send for a transition, without the line ending.
std::string resolve_reply(const Transition& t, const ObserverTableRequest& request);
