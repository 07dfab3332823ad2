#pragma once
#include "edit.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchkit {

// Line table over a text that outlives it. A trailing newline does not
// start an extra line; the empty text has zero lines. Line numbers here
// are 0-based.
class LineIndex {
public:
    explicit LineIndex(std::string_view text);

    size_t line_count() const { return starts_.size(); }
    size_t line_start(size_t line) const;
    // End of line content, excluding "\n" and a preceding "\r"
    size_t line_end(size_t line) const;
    // Start of the following line, or text size for the last line
    size_t line_end_with_newline(size_t line) const;
    size_t line_of(size_t offset) const;
    std::string_view line(size_t line) const;

private:
    std::string_view text_;
    std::vector<size_t> starts_;
};

// Whitespace-normalized copy of a text with a map back to source offsets.
// Every normalized char covers the source range [src_begin[i], src_end[i]).
struct NormalizedText {
    std::string text;
    std::vector<size_t> src_begin;
    std::vector<size_t> src_end;

    // Map a non-empty normalized range back to the source text
    Span to_source(size_t begin, size_t end) const;
};

// Unify line endings, drop indentation and trailing blanks, collapse
// inner runs of spaces/tabs to one space.
NormalizedText normalize_whitespace(std::string_view text);

// Same normalization for a single line, without the offset map
std::string normalize_line(std::string_view line);

// Split on '\n'. "a\n" yields {"a", ""}; "" yields {""}.
std::vector<std::string_view> split_lines(std::string_view text);

bool is_blank(std::string_view s);

struct StrippedText {
    std::string text;
    bool stripped = false;
    std::optional<uint32_t> first_line; // number from the first prefix
};

// Remove "N| " prefixes when more than half of the lines carry one.
StrippedText strip_line_number_prefixes(const std::string& text);

// Levenshtein distance, or nullopt as soon as it must exceed max_dist.
// Only the diagonal band of width 2*max_dist+1 is evaluated.
std::optional<size_t> bounded_edit_distance(std::string_view a, std::string_view b,
                                            size_t max_dist);

// 1 - distance/max(len). Returns nullopt when the score is below min_score.
std::optional<double> similarity(std::string_view a, std::string_view b, double min_score);

} // namespace patchkit
