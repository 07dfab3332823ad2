#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchkit {

// One search/replace pair proposed by the model.
struct EditInstruction {
    std::string search;   // empty = pure insertion
    std::string replace;  // empty = deletion
    size_t order_index = 0;
    std::optional<uint32_t> line_hint; // 1-based, explicit or inferred by the parser
};

enum class MatchStatus {
    Pending,
    Exact,
    Normalized,
    Fuzzy,
    LineRange,
    NotFound
};

// Why an instruction ended up NotFound.
enum class FailureReason {
    None,
    NoMatch,
    OverlapConflict
};

// Half-open byte range [start, end) in the original text.
struct Span {
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }
    bool empty() const { return start == end; }

    // Zero-width points only collide with spans that strictly contain them.
    bool overlaps(const Span& other) const {
        return start < other.end && other.start < end;
    }

    bool operator==(const Span& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const Span& other) const { return !(*this == other); }
};

struct MatchOutcome {
    MatchStatus status = MatchStatus::Pending;
    std::optional<Span> span;   // present iff status is one of the four tiers
    double confidence = 0.0;    // 1.0 for Exact/Normalized, score for Fuzzy
    FailureReason failure = FailureReason::None;

    bool located() const { return span.has_value(); }

    static MatchOutcome not_found(FailureReason reason = FailureReason::NoMatch) {
        MatchOutcome o;
        o.status = MatchStatus::NotFound;
        o.failure = reason;
        return o;
    }
};

struct AppliedBlock {
    EditInstruction instruction;
    MatchOutcome outcome;
};

struct PatchResult {
    std::string new_content;
    std::vector<AppliedBlock> applied_blocks; // same order as the input
    size_t total_applied = 0;
    size_t total_failed = 0;
    std::string status_message;

    bool is_fully_applied() const { return total_failed == 0; }

    // 1-based block numbers of instructions that were not applied
    std::vector<size_t> failed_block_numbers() const;
};

} // namespace patchkit
