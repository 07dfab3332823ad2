#include "match_strategy.hpp"
#include "strategies/exact.hpp"
#include "strategies/normalized.hpp"
#include "strategies/fuzzy.hpp"
#include "strategies/line_range.hpp"

namespace patchkit {

SourceText::SourceText(std::string_view text)
    : text_(text), lines_(text), normalized_(normalize_whitespace(text)) {
    normalized_lines_.reserve(lines_.line_count());
    for (size_t i = 0; i < lines_.line_count(); ++i) {
        normalized_lines_.push_back(normalize_line(lines_.line(i)));
    }
}

std::vector<std::unique_ptr<MatchStrategy>> create_match_strategies(const MatchOptions& options) {
    std::vector<std::unique_ptr<MatchStrategy>> strategies;
    strategies.push_back(std::make_unique<ExactStrategy>());
    if (options.normalized)
        strategies.push_back(std::make_unique<NormalizedStrategy>());
    if (options.fuzzy)
        strategies.push_back(std::make_unique<FuzzyStrategy>(
            options.fuzzy_threshold, options.window_tolerance));
    if (options.line_range)
        strategies.push_back(std::make_unique<LineRangeStrategy>(options.key_line_anchoring));
    return strategies;
}

SearchLines search_lines(std::string_view search) {
    SearchLines out;
    out.lines = split_lines(search);
    if (out.lines.size() > 1 && out.lines.back().empty()) {
        out.lines.pop_back();
        out.ends_with_newline = true;
    }
    return out;
}

Span line_span(const LineIndex& lines, size_t first, size_t last, bool with_newline) {
    size_t end = with_newline ? lines.line_end_with_newline(last) : lines.line_end(last);
    return Span{lines.line_start(first), end};
}

} // namespace patchkit
