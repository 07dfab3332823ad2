#pragma once
#include "../match_strategy.hpp"

namespace patchkit {

// Last resort: take the hinted lines regardless of content, or infer the
// range from a few key lines of the search text. Also resolves pure
// insertions.
class LineRangeStrategy : public MatchStrategy {
public:
    explicit LineRangeStrategy(bool key_line_anchoring)
        : key_line_anchoring_(key_line_anchoring) {}

    MatchStatus tier() const override { return MatchStatus::LineRange; }
    std::string strategy_name() const override { return "line_range"; }
    std::optional<Located> locate(const SourceText& source,
                                  const EditInstruction& instruction,
                                  size_t anchor) const override;

private:
    std::optional<Span> insertion_point(const SourceText& source,
                                        const EditInstruction& instruction) const;
    std::optional<Span> from_hint(const SourceText& source,
                                  const EditInstruction& instruction) const;
    std::optional<Span> from_key_lines(const SourceText& source,
                                       const EditInstruction& instruction) const;

    bool key_line_anchoring_;
};

} // namespace patchkit
