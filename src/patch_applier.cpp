#include "patch_applier.hpp"
#include "report.hpp"
#include <algorithm>
#include <numeric>

namespace patchkit {

namespace {

struct Splice {
    Span span;
    size_t order_index;
    size_t block;  // position in applied_blocks
};

// Text actually spliced in. Insertions keep line structure intact.
std::string splice_text(const std::string& original, const Span& span,
                        const std::string& replace) {
    if (!span.empty() || replace.empty()) return replace;

    std::string text = replace;
    if (span.start == original.size()) {
        if (!original.empty() && original.back() != '\n') text.insert(0, 1, '\n');
        if (!original.empty() && original.back() == '\n' && text.back() != '\n') text += '\n';
    } else if (text.back() != '\n') {
        text += '\n';
    }
    return text;
}

} // namespace

PatchApplier::PatchApplier(MatchOptions options) : engine_(options) {}

PatchResult PatchApplier::apply(const std::string& original,
                                const std::vector<EditInstruction>& instructions) const {
    PatchResult result;
    result.applied_blocks.reserve(instructions.size());
    for (const auto& ins : instructions) {
        result.applied_blocks.push_back(AppliedBlock{ins, MatchOutcome{}});
    }

    // Match in order_index order; input order is kept for reporting
    std::vector<size_t> order(instructions.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&instructions](size_t a, size_t b) {
        return instructions[a].order_index < instructions[b].order_index;
    });

    SourceText source(original);
    MatchState state;
    for (size_t idx : order) {
        MatchOutcome outcome = engine_.locate(source, instructions[idx], state);
        state = arbitrate(std::move(state), outcome);
        result.applied_blocks[idx].outcome = outcome;
    }

    std::vector<Splice> splices;
    for (size_t i = 0; i < result.applied_blocks.size(); ++i) {
        const auto& block = result.applied_blocks[i];
        if (block.outcome.span) {
            splices.push_back(Splice{*block.outcome.span, block.instruction.order_index, i});
        }
    }

    // Back to front. Equal starts: wider span first, then later instruction
    // first, so same-point insertions end up in instruction order.
    std::sort(splices.begin(), splices.end(), [](const Splice& a, const Splice& b) {
        if (a.span.start != b.span.start) return a.span.start > b.span.start;
        if (a.span.end != b.span.end) return a.span.end > b.span.end;
        return a.order_index > b.order_index;
    });

    result.new_content = original;
    for (const auto& s : splices) {
        const std::string& replace = result.applied_blocks[s.block].instruction.replace;
        result.new_content.replace(s.span.start, s.span.length(),
                                   splice_text(original, s.span, replace));
    }

    result.total_applied = splices.size();
    result.total_failed = result.applied_blocks.size() - splices.size();
    result.status_message = summary_line(result);
    return result;
}

PatchResult apply_edits(const std::string& original,
                        const std::vector<EditInstruction>& instructions,
                        const MatchOptions& options) {
    return PatchApplier(options).apply(original, instructions);
}

} // namespace patchkit
