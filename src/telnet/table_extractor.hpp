#pragma once

#include <string>
#include <optional>
#include <regex>
#include <core/constants.hpp>

// Location of a start/end marker pair inside a stream.
struct MarkerSpan {
    size_t begin;           // offset of the start marker
    size_t end;             // offset just past the end marker
    std::string payload;    // text between the marker lines
};

// Find the first start marker and the first end marker after it. The line
// break that terminates the start marker line and the one that precedes the
// end marker belong to the markers, not to the payload. Returns nullopt
// until both markers have arrived.
std::optional<MarkerSpan> find_marker_span(const std::string& text,
                                           const std::string& start_marker,
                                           const std::string& end_marker);

// A listing introduced by a `header` line, opened by a dashed rule line and
// closed by the first `trailer` match after the rule. The payload is the rows
// between rule and trailer with trailing whitespace dropped. Only literal
// searches span the rows, so listings of any length are safe to scan.
std::optional<MarkerSpan> find_ruled_block(const std::string& text,
                                           const std::string& header,
                                           const std::regex& trailer);

// Ephemeris table between $$SOE and $$EOE.
inline std::optional<std::string> extract_table(const std::string& text) {
    auto span = find_marker_span(text, TABLE_START_MARKER, TABLE_END_MARKER);
    if (!span) return std::nullopt;
    return span->payload;
}
