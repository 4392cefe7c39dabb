#include "table_extractor.hpp"
#include <cctype>

std::optional<MarkerSpan> find_marker_span(const std::string& text,
                                           const std::string& start_marker,
                                           const std::string& end_marker) {
    auto start_pos = text.find(start_marker);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }

    auto content_start = start_pos + start_marker.length();
    auto end_pos = text.find(end_marker, content_start);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    if (content_start < end_pos && text[content_start] == '\r')
        content_start++;
    if (content_start < end_pos && text[content_start] == '\n')
        content_start++;

    auto content_end = end_pos;
    if (content_end > content_start && text[content_end - 1] == '\n')
        content_end--;
    if (content_end > content_start && text[content_end - 1] == '\r')
        content_end--;

    return MarkerSpan{start_pos, end_pos + end_marker.length(),
                      text.substr(content_start, content_end - content_start)};
}

std::optional<MarkerSpan> find_ruled_block(const std::string& text,
                                           const std::string& header,
                                           const std::regex& trailer) {
    auto header_pos = text.find(header);
    if (header_pos == std::string::npos) {
        return std::nullopt;
    }

    auto header_end = text.find('\n', header_pos + header.length());
    if (header_end == std::string::npos) {
        return std::nullopt;
    }

    auto rule_pos = text.find("---", header_end + 1);
    if (rule_pos == std::string::npos) {
        return std::nullopt;
    }

    auto rule_end = text.find('\n', rule_pos);
    if (rule_end == std::string::npos) {
        return std::nullopt;
    }
    auto rows_start = rule_end + 1;

    std::smatch m;
    if (!std::regex_search(text.begin() + rows_start, text.end(), m, trailer)) {
        return std::nullopt;
    }
    auto trailer_pos = rows_start + static_cast<size_t>(m.position(0));

    auto rows_end = trailer_pos;
    while (rows_end > rows_start &&
           std::isspace(static_cast<unsigned char>(text[rows_end - 1]))) {
        rows_end--;
    }

    return MarkerSpan{header_pos, trailer_pos + static_cast<size_t>(m.length(0)),
                      text.substr(rows_start, rows_end - rows_start)};
}
