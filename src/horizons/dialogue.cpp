#include "dialogue.hpp"
#include <core/constants.hpp>

namespace {

Transition send(std::string label, Pattern pattern, ReplyKind reply,
                SessionPhase next, std::string literal = "") {
    Transition t{std::move(label), std::move(pattern), ActionKind::Send};
    t.reply = reply;
    t.literal = std::move(literal);
    t.next = next;
    return t;
}

Transition fail(std::string label, Pattern pattern, FailureKind kind) {
    Transition t{std::move(label), std::move(pattern), ActionKind::Fail};
    t.failure = kind;
    return t;
}

// The observer/target/date combination was rejected.
Transition disallowed() {
    Transition t{"disallowed", Pattern(R"([Dd]isallowed)"), ActionKind::SynthesizeDisallowed};
    t.next = SessionPhase::Done;
    return t;
}

// Replies to a submitted target. The server either answers directly or
// first asks "Continue?" and answers after that; both entry points use this
// same list.
std::vector<Transition> resolution_transitions() {
    return {
        send("select-prompt", Pattern(R"(\[E\]phemeris)"),
             ReplyKind::Literal, SessionPhase::SelectingEphemerisType, "E"),
        fail("multiple-major-bodies",
             Pattern::ruled_block("Multiple major-bodies match", R"(Number of matches)"),
             FailureKind::AmbiguousMatch),
        fail("multiple-small-bodies",
             Pattern::ruled_block("Matching small-bodies", R"(\(\d+ matches)"),
             FailureKind::AmbiguousMatch),
        fail("no-matches", Pattern(R"(No matches found)"), FailureKind::NotFound),
    };
}

} // namespace

const Dialogue& Dialogue::horizons() {
    static const Dialogue dialogue;
    return dialogue;
}

Dialogue::Dialogue() {
    const Pattern main_prompt = Pattern::literal("Horizons>");

    table_[SessionPhase::Connecting] = {
        send("main-prompt", main_prompt, ReplyKind::Literal,
             SessionPhase::AwaitingMainPrompt, "PAGE"),
    };

    table_[SessionPhase::AwaitingMainPrompt] = {
        send("main-prompt", main_prompt, ReplyKind::Target, SessionPhase::SubmittingTarget),
    };

    std::vector<Transition> submitting = {
        send("continue-prompt", Pattern(R"(Continue \[)"), ReplyKind::Literal,
             SessionPhase::ResolvingAmbiguity, "yes"),
    };
    for (auto& t : resolution_transitions()) submitting.push_back(std::move(t));
    table_[SessionPhase::SubmittingTarget] = std::move(submitting);

    table_[SessionPhase::ResolvingAmbiguity] = resolution_transitions();

    table_[SessionPhase::SelectingEphemerisType] = {
        send("ephemeris-type-prompt", Pattern(R"(Observe, Elements, Vectors)"),
             ReplyKind::Literal, SessionPhase::SettingCenter, "O"),
    };

    table_[SessionPhase::SettingCenter] = {
        send("coordinate-center-prompt", Pattern(R"(Coordinate center)"),
             ReplyKind::Literal, SessionPhase::SettingStart, ""),
    };

    table_[SessionPhase::SettingStart] = {
        disallowed(),
        send("starting-ut-prompt", Pattern(R"(Starting\s+UT)"),
             ReplyKind::StartTime, SessionPhase::SettingStop),
    };

    // The start time itself can be rejected, so the answer to it is checked
    // for the same reply.
    table_[SessionPhase::SettingStop] = {
        disallowed(),
        send("ending-ut-prompt", Pattern(R"(Ending\s+UT)"),
             ReplyKind::Literal, SessionPhase::SettingStep, ""),
    };

    table_[SessionPhase::SettingStep] = {
        send("output-interval-prompt", Pattern(R"(Output interval)"),
             ReplyKind::StepSize, SessionPhase::ConfirmingDefaults),
    };

    table_[SessionPhase::ConfirmingDefaults] = {
        send("accept-default-prompt", Pattern(R"(Accept default output)"),
             ReplyKind::Literal, SessionPhase::SettingQuantities, "Y"),
    };

    table_[SessionPhase::SettingQuantities] = {
        send("select-quantities-prompt", Pattern(R"(Select table quantities)"),
             ReplyKind::QuantityCode, SessionPhase::AwaitingTable),
    };

    {
        Transition table{"table", Pattern::between(TABLE_START_MARKER, TABLE_END_MARKER),
                         ActionKind::ExtractTable};
        table.reply = ReplyKind::Literal;
        table.literal = "q";
        table.next = SessionPhase::Done;
        table_[SessionPhase::AwaitingTable] = {table};
    }
}

const std::vector<Transition>& Dialogue::transitions(SessionPhase phase) const {
    return table_.at(phase);
}

std::vector<Pattern> Dialogue::patterns(SessionPhase phase) const {
    std::vector<Pattern> out;
    for (const auto& t : transitions(phase)) out.push_back(t.pattern);
    return out;
}

std::string resolve_reply(const Transition& t, const ObserverTableRequest& request) {
    switch (t.reply) {
        case ReplyKind::None:         return "";
        case ReplyKind::Literal:      return t.literal;
        case ReplyKind::Target:       return request.target;
        case ReplyKind::StartTime:    return request.start_time;
        case ReplyKind::StepSize:     return request.step_size;
        case ReplyKind::QuantityCode: return request.quantity_code;
    }
    return "";
}
