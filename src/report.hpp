#pragma once
#include "edit.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace patchkit {

// Short label shown on each block: EXACT, NORM, FUZZY, RANGE, NOT FOUND, PENDING
std::string status_label(MatchStatus status);

// Machine-readable failure name (none, no_match, overlap_conflict)
std::string failure_name(FailureReason reason);

// Label plus detail, e.g. "FUZZY 87%" or "NOT FOUND (overlap)"
std::string badge_text(const AppliedBlock& block);

// "No changes", "3/3 edits applied", or
// "4/5 edits applied \u2014 1 not found: #3" (em dash separator)
std::string summary_line(const PatchResult& result);

// Summary line followed by one line per block with its original line range
std::string format_report(const PatchResult& result, const std::string& original);

// Unified-diff-like preview of one block against the original text.
// number is the 1-based block number shown in the header.
std::string render_block_preview(const std::string& original, const AppliedBlock& block,
                                 size_t number);

nlohmann::json report_json(const PatchResult& result, const std::string& original);

} // namespace patchkit
