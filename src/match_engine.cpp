#include "match_engine.hpp"
#include <utility>

namespace patchkit {

bool MatchState::conflicts_with(const Span& span) const {
    for (const auto& s : accepted) {
        if (s.overlaps(span)) return true;
    }
    return false;
}

MatchState arbitrate(MatchState state, MatchOutcome& outcome) {
    if (!outcome.span) return state;

    if (state.conflicts_with(*outcome.span)) {
        outcome = MatchOutcome::not_found(FailureReason::OverlapConflict);
        return state;
    }
    state.accepted.push_back(*outcome.span);
    state.anchor = outcome.span->end;
    return state;
}

MatchEngine::MatchEngine(MatchOptions options)
    : options_(options), strategies_(create_match_strategies(options_)) {}

MatchOutcome MatchEngine::locate(std::string_view original,
                                 const EditInstruction& instruction) const {
    SourceText source(original);
    return locate(source, instruction, MatchState{});
}

MatchOutcome MatchEngine::locate(const SourceText& source,
                                 const EditInstruction& instruction,
                                 const MatchState& state) const {
    for (const auto& strategy : strategies_) {
        auto hit = strategy->locate(source, instruction, state.anchor);
        if (!hit) continue;

        MatchOutcome outcome;
        outcome.status = strategy->tier();
        outcome.span = hit->span;
        outcome.confidence = hit->confidence;
        return outcome;
    }
    return MatchOutcome::not_found();
}

} // namespace patchkit
