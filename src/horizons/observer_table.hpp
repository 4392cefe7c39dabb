#pragma once

#include <string>
#include <core/constants.hpp>
#include "session_phase.hpp"

struct ObserverTableRequest {
    std::string target;             // passed verbatim, never normalized
    std::string start_time;
    std::string step_size = DEFAULT_STEP_SIZE;
    std::string quantity_code = DEFAULT_QUANTITY_CODE;
};

enum class FailureKind {
    None,
    ConnectionError,    // unreachable, unresolvable, or stream closed mid-session
    Timeout,            // no expected prompt within the step window
    AmbiguousMatch,     // diagnostic holds the raw candidate list
    NotFound,
    Cancelled,
};

inline const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None:            return "None";
        case FailureKind::ConnectionError: return "ConnectionError";
        case FailureKind::Timeout:         return "Timeout";
        case FailureKind::AmbiguousMatch:  return "AmbiguousMatch";
        case FailureKind::NotFound:        return "NotFound";
        case FailureKind::Cancelled:       return "Cancelled";
    }
    return "Unknown";
}

struct ObserverTableResult {
    FailureKind failure = FailureKind::None;
    std::string table;              // extracted payload (success only)
    std::string diagnostic;         // failure detail (candidate list for AmbiguousMatch)
    bool synthesized = false;       // placeholder line from a "disallowed" reply
    SessionPhase failed_at = SessionPhase::Done;

    bool ok() const { return failure == FailureKind::None; }

    static ObserverTableResult Ok(std::string table, bool synthesized = false) {
        ObserverTableResult r;
        r.table = std::move(table);
        r.synthesized = synthesized;
        return r;
    }

    static ObserverTableResult Fail(FailureKind kind, SessionPhase phase, std::string diagnostic) {
        ObserverTableResult r;
        r.failure = kind;
        r.failed_at = phase;
        r.diagnostic = std::move(diagnostic);
        return r;
    }

    bool operator==(const ObserverTableResult& o) const {
        return failure == o.failure && table == o.table && diagnostic == o.diagnostic &&
               synthesized == o.synthesized && failed_at == o.failed_at;
    }
};

// Process exit status: 0 success, 2 ambiguous match, 1 everything else.
inline int exit_code_for(const ObserverTableResult& result) {
    if (result.ok()) return 0;
    if (result.failure == FailureKind::AmbiguousMatch) return 2;
    return 1;
}
