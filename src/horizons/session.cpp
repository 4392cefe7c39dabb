#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <telnet/telnet_channel.hpp>
#include <fmt/format.h>
#include <iostream>

HorizonsSession::HorizonsSession(SessionConfig config, ChannelOpener opener)
    : config_(std::move(config)), opener_(std::move(opener)),
      dialogue_(Dialogue::horizons()) {}

ChannelOpener HorizonsSession::open_default_channel() {
    return &open_telnet_channel;
}

ObserverTableResult HorizonsSession::run(const ObserverTableRequest& request) {
    ObserverTableResult result = run_dialogue(request);
    cancel_requested_.store(false);
    return result;
}

ObserverTableResult HorizonsSession::run_dialogue(const ObserverTableRequest& request) {
    echo_log(fmt::format("HorizonsSession: target='{}' start='{}' step='{}' quantities='{}'",
                         request.target, request.start_time,
                         request.step_size, request.quantity_code));

    auto opened = opener_(config_.host, config_.port, config_.connect_timeout);
    if (opened.is_err()) {
        echo_log("HorizonsSession: connect failed: " + opened.error);
        return ObserverTableResult::Fail(FailureKind::ConnectionError,
                                         SessionPhase::Connecting, opened.error);
    }
    ChannelPtr channel = std::move(opened.value);
    ChannelGuard guard(*channel);

    ExpectMatcher matcher;
    matcher.set_cancel_flag(&cancel_requested_);
    if (config_.verbose) {
        matcher.set_transcript_sink([](const std::string& text) { std::cerr << text; });
    }

    SessionPhase phase = SessionPhase::Connecting;
    std::optional<std::string> input;  // nothing to send before the banner

    while (true) {
        MatchResult m = step(*channel, matcher, phase, input);
        if (!m.matched) {
            return fail_from_match(phase, m);
        }

        const Transition& t = dialogue_.transitions(phase).at(m.pattern_index);
        echo_log(fmt::format("HorizonsSession: [{}] matched {}", to_string(phase), t.label));

        switch (t.action) {
            case ActionKind::Send:
                input = resolve_reply(t, request);
                phase = t.next;
                break;

            case ActionKind::Fail: {
                std::string diagnostic = m.captured.empty() ? m.matched_text : m.captured.front();
                echo_log(fmt::format("HorizonsSession: {} at {}", to_string(t.failure), to_string(phase)));
                return ObserverTableResult::Fail(t.failure, phase, diagnostic);
            }

            case ActionKind::SynthesizeDisallowed:
                echo_log("HorizonsSession: start date disallowed, synthesizing placeholder line");
                return ObserverTableResult::Ok(
                    fmt::format("{} {}", request.start_time, DISALLOWED_PLACEHOLDER), true);

            case ActionKind::ExtractTable: {
                std::string table = m.captured.empty() ? std::string() : m.captured.front();
                auto ack = channel->send(resolve_reply(t, request) + LINE_ENDING);
                if (ack.is_err()) {
                    echo_log("HorizonsSession: final acknowledgement not sent: " + ack.error);
                }
                echo_log(fmt::format("HorizonsSession: table extracted ({} bytes)", table.size()));
                return ObserverTableResult::Ok(std::move(table));
            }
        }
    }
}

MatchResult HorizonsSession::step(Channel& channel, ExpectMatcher& matcher,
                                  SessionPhase phase, const std::optional<std::string>& input) {
    if (input) {
        echo_log(fmt::format("HorizonsSession: [{}] send '{}'", to_string(phase), *input));
        auto sent = channel.send(*input + LINE_ENDING);
        if (sent.is_err()) {
            MatchResult failed;
            failed.error = sent.error;
            return failed;
        }
    }
    return matcher.expect(channel, dialogue_.patterns(phase), config_.step_timeout);
}

ObserverTableResult HorizonsSession::fail_from_match(SessionPhase phase, const MatchResult& m) const {
    if (m.cancelled) {
        echo_log(fmt::format("HorizonsSession: cancelled at {}", to_string(phase)));
        return ObserverTableResult::Fail(FailureKind::Cancelled, phase, "Session cancelled");
    }
    if (!m.error.empty()) {
        echo_log(fmt::format("HorizonsSession: stream error at {}: {}", to_string(phase), m.error));
        return ObserverTableResult::Fail(FailureKind::ConnectionError, phase, m.error);
    }
    echo_log(fmt::format("HorizonsSession: timeout at {}, unmatched tail '{}'",
                         to_string(phase), escape_for_log(m.before_text.size() > 200
                             ? m.before_text.substr(m.before_text.size() - 200)
                             : m.before_text)));
    return ObserverTableResult::Fail(FailureKind::Timeout, phase,
        fmt::format("No expected prompt within {}ms at {}",
                    config_.step_timeout.count(), to_string(phase)));
}
