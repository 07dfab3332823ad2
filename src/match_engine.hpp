#pragma once
#include "edit.hpp"
#include "match_strategy.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace patchkit {

// Accumulator threaded through the match fold over an instruction
// sequence. Only accepted spans move the anchor.
struct MatchState {
    size_t anchor = 0;
    std::vector<Span> accepted;

    bool conflicts_with(const Span& span) const;
};

// First-writer-wins: a located outcome that overlaps an accepted span is
// downgraded to NotFound(OverlapConflict); otherwise it is accepted and
// becomes the new anchor.
MatchState arbitrate(MatchState state, MatchOutcome& outcome);

class MatchEngine {
public:
    explicit MatchEngine(MatchOptions options = {});

    // Standalone lookup with no earlier edits
    MatchOutcome locate(std::string_view original, const EditInstruction& instruction) const;

    // Tries each enabled tier in turn; the first hit wins
    MatchOutcome locate(const SourceText& source, const EditInstruction& instruction,
                        const MatchState& state) const;

    const MatchOptions& options() const { return options_; }

private:
    MatchOptions options_;
    std::vector<std::unique_ptr<MatchStrategy>> strategies_;
};

} // namespace patchkit
