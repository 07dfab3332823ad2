#pragma once
#include "edit.hpp"
#include "text.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchkit {

struct MatchOptions {
    double fuzzy_threshold = 0.8;   // minimum similarity for the fuzzy tier
    uint32_t window_tolerance = 1;  // fuzzy windows span L +/- this many lines
    bool normalized = true;
    bool fuzzy = true;
    bool line_range = true;
    bool key_line_anchoring = true; // line range without a hint
};

// The original text plus the derived views every strategy needs.
// Holds views into the caller's string, which must outlive it.
class SourceText {
public:
    explicit SourceText(std::string_view text);

    std::string_view text() const { return text_; }
    const LineIndex& lines() const { return lines_; }
    const NormalizedText& normalized() const { return normalized_; }
    // normalize_line() of every line, computed once
    const std::vector<std::string>& normalized_lines() const { return normalized_lines_; }

private:
    std::string_view text_;
    LineIndex lines_;
    NormalizedText normalized_;
    std::vector<std::string> normalized_lines_;
};

struct Located {
    Span span;
    double confidence = 1.0;
};

class MatchStrategy {
public:
    virtual ~MatchStrategy() = default;
    virtual MatchStatus tier() const = 0;
    virtual std::string strategy_name() const = 0;

    // anchor: end of the most recently accepted span, 0 for the first edit
    virtual std::optional<Located> locate(const SourceText& source,
                                          const EditInstruction& instruction,
                                          size_t anchor) const = 0;
};

// Enabled strategies in decreasing precision
std::vector<std::unique_ptr<MatchStrategy>> create_match_strategies(const MatchOptions& options);

// Search text split into lines; a trailing newline is recorded, not kept
// as an empty last line.
struct SearchLines {
    std::vector<std::string_view> lines;
    bool ends_with_newline = false;
};

SearchLines search_lines(std::string_view search);

// Span over whole lines [first, last]; includes the final newline when asked
Span line_span(const LineIndex& lines, size_t first, size_t last, bool with_newline);

} // namespace patchkit
