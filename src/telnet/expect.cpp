#include "expect.hpp"
#include "table_extractor.hpp"
#include <core/constants.hpp>
#include <algorithm>

Pattern Pattern::literal(const std::string& text) {
    Pattern p(std::regex_replace(text, std::regex(R"([.^$|()\[\]{}*+?\\])"), R"(\$&)"));
    p.kind = Kind::Literal;
    p.raw = text;
    return p;
}

Pattern Pattern::between(const std::string& start_marker, const std::string& end_marker) {
    Pattern p = literal(start_marker);
    p.kind = Kind::MarkerPair;
    p.end = end_marker;
    return p;
}

Pattern Pattern::ruled_block(const std::string& header, const std::string& trailer) {
    Pattern p(trailer);
    p.kind = Kind::RuledBlock;
    p.raw = header;
    p.end = trailer;
    return p;
}

std::optional<PatternHit> Pattern::search(const std::string& buffer) const {
    switch (kind) {
        case Kind::Literal: {
            auto pos = buffer.find(raw);
            if (pos == std::string::npos) return std::nullopt;
            return PatternHit{pos, raw.size(), {}};
        }
        case Kind::MarkerPair: {
            auto span = find_marker_span(buffer, raw, end);
            if (!span) return std::nullopt;
            return PatternHit{span->begin, span->end - span->begin, {span->payload}};
        }
        case Kind::RuledBlock: {
            auto span = find_ruled_block(buffer, raw, regex);
            if (!span) return std::nullopt;
            return PatternHit{span->begin, span->end - span->begin, {span->payload}};
        }
        case Kind::Regex:
            break;
    }

    std::smatch match;
    if (!std::regex_search(buffer, match, regex)) {
        return std::nullopt;
    }
    PatternHit hit{static_cast<size_t>(match.position(0)),
                   static_cast<size_t>(match.length(0)), {}};
    for (size_t i = 1; i < match.size(); ++i) {
        hit.groups.push_back(match[i].str());
    }
    return hit;
}

ExpectMatcher::ExpectMatcher() = default;

void ExpectMatcher::set_transcript_sink(std::function<void(const std::string&)> sink) {
    transcript_ = std::move(sink);
}

MatchResult ExpectMatcher::expect(
    Channel& channel,
    const std::vector<Pattern>& patterns,
    std::chrono::milliseconds timeout) {

    auto start = std::chrono::steady_clock::now();
    MatchResult result;

    while (true) {
        // Check if we have a match in current buffer
        if (check_patterns(patterns, result)) {
            return result;
        }

        if (is_cancelled()) {
            result.cancelled = true;
            result.before_text = buffer_;
            return result;
        }

        // Check timeout
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed >= timeout) {
            result.timed_out = true;
            result.before_text = buffer_;
            return result;
        }

        // Wait for data, in short slices so cancellation stays responsive
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(timeout - elapsed);
        auto slice = std::min(remaining, std::chrono::milliseconds(EXPECT_POLL_MS));
        if (slice.count() <= 0) slice = std::chrono::milliseconds(1);

        auto data = channel.read_available(slice);
        if (data.is_err()) {
            // Whatever arrived before the close still gets one last look.
            if (check_patterns(patterns, result)) {
                return result;
            }
            result.error = data.error;
            result.before_text = buffer_;
            return result;
        }
        if (data.value.empty()) {
            continue;
        }

        if (transcript_) transcript_(data.value);
        buffer_ += data.value;
    }
}

bool ExpectMatcher::check_patterns(const std::vector<Pattern>& patterns,
                                   MatchResult& result) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        auto hit = patterns[i].search(buffer_);
        if (!hit) continue;

        result.matched = true;
        result.pattern_index = i;
        result.captured = std::move(hit->groups);
        result.matched_text = buffer_.substr(hit->position, hit->length);
        result.before_text = buffer_.substr(0, hit->position);
        buffer_.erase(0, hit->position + hit->length);
        return true;
    }
    return false;
}
