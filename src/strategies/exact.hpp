#pragma once
#include "../match_strategy.hpp"

namespace patchkit {

// Literal substring search
class ExactStrategy : public MatchStrategy {
public:
    MatchStatus tier() const override { return MatchStatus::Exact; }
    std::string strategy_name() const override { return "exact"; }
    std::optional<Located> locate(const SourceText& source,
                                  const EditInstruction& instruction,
                                  size_t anchor) const override;
};

} // namespace patchkit
