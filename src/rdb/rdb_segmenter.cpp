/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb/rdb_segmenter.h"

#include "rdb/rdb_error.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace rdbdump::rdb {
namespace {
const std::regex& table_header_regex() {
    static const std::regex re(R"(^\[[^\s\[\]]+\])");
    return re;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_comment_line(std::string_view line) {
    const auto it = std::find_if_not(line.begin(), line.end(), is_space);
    return it != line.end() && *it == '#';
}
}  // namespace

bool is_table_header_line(std::string_view line) {
    return std::regex_search(line.begin(), line.end(), table_header_regex());
}

bool is_blank_line(std::string_view line) {
    return std::all_of(line.begin(), line.end(), is_space);
}

StreamSegmenter::StreamSegmenter(FragmentHandler handler) : handler_(std::move(handler)) {}

void StreamSegmenter::dispatch(Fragment& fragment) {
    Fragment out = std::move(fragment);
    fragment = Fragment{};
    dispatched_++;
    handler_(out);
}

void StreamSegmenter::feed_line(std::string_view line) {
    line_no_++;
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    if (accumulating()) {
        if (is_blank_line(line)) {
            dispatch(block_);
            return;
        }
        block_.text.push_back('\n');
        block_.text.append(line);
        return;
    }

    if (is_blank_line(line) || is_comment_line(line)) {
        return;
    }
    if (is_table_header_line(line)) {
        block_.text.assign(line);
        block_.first_line = line_no_;
        return;
    }
    Fragment single{std::string(line), line_no_};
    dispatch(single);
}

void StreamSegmenter::finish() {
    if (accumulating()) {
        dispatch(block_);
    }
}

void segment_stream(std::istream& in, StreamSegmenter& segmenter) {
    std::string line;
    while (std::getline(in, line)) {
        segmenter.feed_line(line);
    }
    if (in.bad()) {
        throw RdbError(
            ErrorKind::IoFailure,
            std::string("Failed to read input after line ") + std::to_string(segmenter.lines_seen())
        );
    }
    segmenter.finish();
}
}  // namespace rdbdump::rdb
