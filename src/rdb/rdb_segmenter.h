/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <string_view>

namespace rdbdump::rdb {
struct Fragment {
    std::string text;
    std::size_t first_line = 0;
};

// "[name]" at the start of a line, name without whitespace or brackets.
// Deliberately not a TOML grammar: "[[x]]" and "[a b]" do not match.
bool is_table_header_line(std::string_view line);

bool is_blank_line(std::string_view line);

/**
 * Groups input lines into record fragments.
 *
 * Idle: blank lines and comment lines are skipped, a table header starts a
 * block, any other line is dispatched on its own.
 * Accumulating: lines are joined with '\n' until a blank line, which
 * dispatches the block. Header-shaped lines inside a block are plain content.
 * finish() dispatches a block left open at end of input.
 */
class StreamSegmenter {
   public:
    using FragmentHandler = std::function<void(const Fragment&)>;

    explicit StreamSegmenter(FragmentHandler handler);

    void feed_line(std::string_view line);
    void finish();

    bool accumulating() const { return !block_.text.empty(); }
    std::size_t lines_seen() const { return line_no_; }
    std::size_t fragments_dispatched() const { return dispatched_; }

   private:
    void dispatch(Fragment& fragment);

    FragmentHandler handler_;
    Fragment block_;
    std::size_t line_no_ = 0;
    std::size_t dispatched_ = 0;
};

// Feeds every line of `in` (LF or CRLF terminated) and calls finish().
void segment_stream(std::istream& in, StreamSegmenter& segmenter);
}  // namespace rdbdump::rdb
