#include "line_range.hpp"
#include <algorithm>
#include <array>

namespace patchkit {

std::optional<Located> LineRangeStrategy::locate(const SourceText& source,
                                                 const EditInstruction& instruction,
                                                 size_t /*anchor*/) const {
    std::optional<Span> span;
    if (instruction.search.empty()) {
        span = insertion_point(source, instruction);
    } else {
        span = from_hint(source, instruction);
        if (!span && key_line_anchoring_) {
            span = from_key_lines(source, instruction);
        }
    }
    if (!span) return std::nullopt;
    return Located{*span, 0.0};
}

std::optional<Span> LineRangeStrategy::insertion_point(const SourceText& source,
                                                       const EditInstruction& instruction) const {
    const size_t end = source.text().size();
    if (!instruction.line_hint) {
        return Span{end, end};
    }

    const size_t hint = *instruction.line_hint;
    const LineIndex& lines = source.lines();
    if (hint == 0 || hint > lines.line_count() + 1) return std::nullopt;

    size_t offset = hint <= lines.line_count() ? lines.line_start(hint - 1) : end;
    return Span{offset, offset};
}

std::optional<Span> LineRangeStrategy::from_hint(const SourceText& source,
                                                 const EditInstruction& instruction) const {
    if (!instruction.line_hint) return std::nullopt;

    const size_t hint = *instruction.line_hint;
    const LineIndex& lines = source.lines();
    if (hint == 0 || hint > lines.line_count()) return std::nullopt;

    SearchLines wanted = search_lines(instruction.search);
    size_t first = hint - 1;
    size_t last = std::min(lines.line_count() - 1, first + wanted.lines.size() - 1);
    return line_span(lines, first, last, wanted.ends_with_newline);
}

std::optional<Span> LineRangeStrategy::from_key_lines(const SourceText& source,
                                                      const EditInstruction& instruction) const {
    SearchLines wanted = search_lines(instruction.search);

    std::vector<std::string> significant;
    for (auto line : wanted.lines) {
        if (!is_blank(line)) significant.push_back(normalize_line(line));
    }
    if (significant.size() < 3) return std::nullopt;

    const std::array<const std::string*, 3> keys = {
        &significant.front(),
        &significant[significant.size() / 2],
        &significant.back()
    };

    const auto& file_lines = source.normalized_lines();
    std::array<size_t, 3> found{};
    size_t from = 0;
    for (size_t k = 0; k < keys.size(); ++k) {
        size_t i = from;
        while (i < file_lines.size() && file_lines[i] != *keys[k]) ++i;
        if (i == file_lines.size()) return std::nullopt;
        found[k] = i;
        from = i + 1;
    }

    size_t range = found[2] - found[0] + 1;
    if (range > significant.size() * 2) return std::nullopt;

    return line_span(source.lines(), found[0], found[2], wanted.ends_with_newline);
}

} // namespace patchkit
