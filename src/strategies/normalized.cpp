#include "normalized.hpp"
#include <algorithm>

namespace patchkit {

std::optional<Located> NormalizedStrategy::locate(const SourceText& source,
                                                  const EditInstruction& instruction,
                                                  size_t anchor) const {
    const std::string& search = instruction.search;
    if (search.empty()) return std::nullopt;

    std::string needle = normalize_whitespace(search).text;
    if (is_blank(needle)) return std::nullopt;

    const NormalizedText& haystack = source.normalized();

    // First normalized char whose source offset is at or past the anchor
    auto it = std::lower_bound(haystack.src_begin.begin(), haystack.src_begin.end(), anchor);
    auto norm_anchor = static_cast<size_t>(it - haystack.src_begin.begin());

    size_t pos = std::string::npos;
    if (norm_anchor < haystack.text.size()) {
        pos = haystack.text.find(needle, norm_anchor);
    }
    if (pos == std::string::npos) {
        pos = haystack.text.find(needle);
    }
    if (pos == std::string::npos) return std::nullopt;

    Span span = haystack.to_source(pos, pos + needle.size());

    // The model supplied its own indentation: replace the original's too
    bool search_indented = search[0] == ' ' || search[0] == '\t';
    bool at_line_start = pos == 0 || haystack.text[pos - 1] == '\n';
    if (search_indented && at_line_start) {
        const LineIndex& lines = source.lines();
        span.start = lines.line_start(lines.line_of(span.start));
    }

    return Located{span, 1.0};
}

} // namespace patchkit
