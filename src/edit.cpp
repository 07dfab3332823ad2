#include "edit.hpp"

namespace patchkit {

std::vector<size_t> PatchResult::failed_block_numbers() const {
    std::vector<size_t> numbers;
    for (size_t i = 0; i < applied_blocks.size(); ++i) {
        if (applied_blocks[i].outcome.status == MatchStatus::NotFound) {
            numbers.push_back(i + 1);
        }
    }
    return numbers;
}

} // namespace patchkit
