#include "exact.hpp"

namespace patchkit {

std::optional<Located> ExactStrategy::locate(const SourceText& source,
                                             const EditInstruction& instruction,
                                             size_t anchor) const {
    const std::string& search = instruction.search;
    if (search.empty()) return std::nullopt;

    std::string_view text = source.text();
    size_t pos = std::string_view::npos;
    if (anchor < text.size()) {
        pos = text.find(search, anchor);
    }
    // Nothing after the anchor: fall back to the first occurrence
    if (pos == std::string_view::npos) {
        pos = text.find(search);
    }
    if (pos == std::string_view::npos) return std::nullopt;

    return Located{Span{pos, pos + search.size()}, 1.0};
}

} // namespace patchkit
