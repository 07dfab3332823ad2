#pragma once
#include "../match_strategy.hpp"

namespace patchkit {

// Exact search after whitespace normalization of both sides, mapped
// back to the un-normalized span.
class NormalizedStrategy : public MatchStrategy {
public:
    MatchStatus tier() const override { return MatchStatus::Normalized; }
    std::string strategy_name() const override { return "normalized"; }
    std::optional<Located> locate(const SourceText& source,
                                  const EditInstruction& instruction,
                                  size_t anchor) const override;
};

} // namespace patchkit
