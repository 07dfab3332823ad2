#pragma once
#include "../match_strategy.hpp"

namespace patchkit {

// Scores every window of L +/- tolerance lines against the search text
// and accepts the best one at or above the threshold.
class FuzzyStrategy : public MatchStrategy {
public:
    FuzzyStrategy(double threshold, uint32_t window_tolerance)
        : threshold_(threshold), window_tolerance_(window_tolerance) {}

    MatchStatus tier() const override { return MatchStatus::Fuzzy; }
    std::string strategy_name() const override { return "fuzzy"; }
    std::optional<Located> locate(const SourceText& source,
                                  const EditInstruction& instruction,
                                  size_t anchor) const override;

private:
    double threshold_;
    uint32_t window_tolerance_;
};

} // namespace patchkit
