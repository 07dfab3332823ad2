#pragma once
#include "edit.hpp"
#include "match_engine.hpp"
#include <string>
#include <vector>

namespace patchkit {

// Resolves every instruction against the original text, drops overlapping
// ones, and splices the survivors in from the end of the text backwards.
// Never fails as a whole: unresolved instructions are reported per block.
class PatchApplier {
public:
    explicit PatchApplier(MatchOptions options = {});

    PatchResult apply(const std::string& original,
                      const std::vector<EditInstruction>& instructions) const;

    const MatchEngine& engine() const { return engine_; }

private:
    MatchEngine engine_;
};

PatchResult apply_edits(const std::string& original,
                        const std::vector<EditInstruction>& instructions,
                        const MatchOptions& options = {});

} // namespace patchkit
