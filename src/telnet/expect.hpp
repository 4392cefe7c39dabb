#pragma once

#include <string>
#include <vector>
#include <regex>
#include <chrono>
#include <atomic>
#include <optional>
#include <functional>
#include "channel.hpp"

struct PatternHit {
    size_t position;
    size_t length;
    std::vector<std::string> groups;
};

struct Pattern {
    enum class Kind { Literal, Regex, MarkerPair, RuledBlock };

    Kind kind;
    std::string raw;        // literal text, regex source, start marker or block header
    std::string end;        // end marker (MarkerPair) or trailer source (RuledBlock)
    std::regex regex;       // compiled trailer for RuledBlock

    // ECMAScript regex. Capture groups are reported in MatchResult::captured.
    Pattern(const std::string& pattern)
        : kind(Kind::Regex), raw(pattern), regex(pattern, std::regex::ECMAScript) {}

    static Pattern literal(const std::string& text);

    // Everything between two literal markers; the payload is the only capture.
    static Pattern between(const std::string& start_marker, const std::string& end_marker);

    // Rows of a listing: `header` line, dashed rule, rows, then a match of
    // the `trailer` regex. The rows are the only capture.
    static Pattern ruled_block(const std::string& header, const std::string& trailer);

    std::optional<PatternHit> search(const std::string& buffer) const;
};

struct MatchResult {
    bool matched = false;
    bool timed_out = false;
    bool cancelled = false;
    std::string error;                  // set when the stream closed or broke
    size_t pattern_index = 0;
    std::vector<std::string> captured;  // capture groups of the winning pattern
    std::string matched_text;
    std::string before_text;
};

class ExpectMatcher {
public:
    ExpectMatcher();

    // Optional. When the flag becomes true the pending expect() returns
    // with `cancelled` set.
    void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

    // Optional. Receives every chunk of text read from the channel.
    void set_transcript_sink(std::function<void(const std::string&)> sink);

    // Wait until one of `patterns` matches the accumulated buffer. Patterns
    // are tried in order and the first match wins. On a match the buffer is
    // consumed through the end of the matched text; anything after it is
    // kept for the next call.
    MatchResult expect(
        Channel& channel,
        const std::vector<Pattern>& patterns,
        std::chrono::milliseconds timeout
    );

    const std::string& get_buffer() const { return buffer_; }

private:
    std::string buffer_;
    const std::atomic<bool>* cancel_ = nullptr;
    std::function<void(const std::string&)> transcript_;

    bool check_patterns(const std::vector<Pattern>& patterns, MatchResult& result);
    bool is_cancelled() const { return cancel_ && cancel_->load(); }
};
