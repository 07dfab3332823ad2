#include "report.hpp"
#include "match_strategy.hpp"
#include "text.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace patchkit {

namespace {

struct LineRange {
    size_t first = 0; // 1-based
    size_t last = 0;
};

LineRange lines_of(const LineIndex& index, const Span& span) {
    size_t first = index.line_of(span.start);
    size_t last = span.empty() ? first : index.line_of(span.end - 1);
    return LineRange{first + 1, last + 1};
}

std::string describe_location(const LineIndex& index, const std::string& original,
                              const Span& span) {
    if (span.empty()) {
        if (span.start == original.size()) return "append at end";
        return "insert at line " + std::to_string(index.line_of(span.start) + 1);
    }
    LineRange r = lines_of(index, span);
    if (r.first == r.last) return "line " + std::to_string(r.first);
    return "lines " + std::to_string(r.first) + "-" + std::to_string(r.last);
}

size_t count_overlaps(const PatchResult& result) {
    size_t n = 0;
    for (const auto& b : result.applied_blocks) {
        if (b.outcome.failure == FailureReason::OverlapConflict) ++n;
    }
    return n;
}

} // namespace

std::string status_label(MatchStatus status) {
    switch (status) {
        case MatchStatus::Pending:    return "PENDING";
        case MatchStatus::Exact:      return "EXACT";
        case MatchStatus::Normalized: return "NORM";
        case MatchStatus::Fuzzy:      return "FUZZY";
        case MatchStatus::LineRange:  return "RANGE";
        case MatchStatus::NotFound:   return "NOT FOUND";
    }
    return "PENDING";
}

std::string failure_name(FailureReason reason) {
    switch (reason) {
        case FailureReason::None:            return "none";
        case FailureReason::NoMatch:         return "no_match";
        case FailureReason::OverlapConflict: return "overlap_conflict";
    }
    return "none";
}

std::string badge_text(const AppliedBlock& block) {
    const MatchOutcome& o = block.outcome;
    std::string label = status_label(o.status);
    switch (o.status) {
        case MatchStatus::Fuzzy: {
            auto pct = static_cast<int>(std::floor(o.confidence * 100.0 + 1e-9));
            return label + " " + std::to_string(pct) + "%";
        }
        case MatchStatus::NotFound:
            if (o.failure == FailureReason::OverlapConflict) return label + " (overlap)";
            return label;
        case MatchStatus::Pending:
        case MatchStatus::Exact:
        case MatchStatus::Normalized:
        case MatchStatus::LineRange:
            return label;
    }
    return label;
}

std::string summary_line(const PatchResult& result) {
    const size_t total = result.applied_blocks.size();
    if (total == 0) return "No changes";

    std::string line = std::to_string(result.total_applied) + "/" + std::to_string(total)
        + " edits applied";
    if (result.total_failed == 0) return line;

    line += " \xe2\x80\x94 " + std::to_string(result.total_failed) + " not found: ";
    auto failed = result.failed_block_numbers();
    for (size_t i = 0; i < failed.size(); ++i) {
        if (i > 0) line += ", ";
        line += "#" + std::to_string(failed[i]);
    }

    size_t overlaps = count_overlaps(result);
    if (overlaps > 0) {
        line += " (" + std::to_string(overlaps) + " overlapping)";
    }
    return line;
}

std::string format_report(const PatchResult& result, const std::string& original) {
    LineIndex index(original);
    std::ostringstream ss;
    ss << summary_line(result) << "\n";

    for (size_t i = 0; i < result.applied_blocks.size(); ++i) {
        const auto& block = result.applied_blocks[i];
        ss << "  #" << std::left << std::setw(3) << (i + 1)
           << std::setw(20) << badge_text(block);
        if (block.outcome.span) {
            ss << describe_location(index, original, *block.outcome.span);
        } else if (block.outcome.failure == FailureReason::OverlapConflict) {
            ss << "overlaps an earlier edit";
        } else {
            ss << "search text not located";
        }
        ss << "\n";
    }
    return ss.str();
}

std::string render_block_preview(const std::string& original, const AppliedBlock& block,
                                 size_t number) {
    std::ostringstream ss;
    ss << "#" << number << " " << badge_text(block) << "\n";

    const auto& ins = block.instruction;
    std::vector<std::string_view> removed;
    std::vector<std::string_view> added;
    if (!ins.replace.empty()) added = search_lines(ins.replace).lines;

    if (!block.outcome.span) {
        ss << "search text not located:\n";
        for (auto line : search_lines(ins.search).lines) {
            ss << "  " << line << "\n";
        }
        return ss.str();
    }

    const Span& span = *block.outcome.span;
    std::string_view matched = std::string_view(original).substr(span.start, span.length());
    if (!matched.empty()) removed = search_lines(matched).lines;

    LineIndex index(original);
    size_t first = span.start == original.size() && !original.empty() && original.back() == '\n'
        ? index.line_count() + 1
        : index.line_of(span.start) + 1;

    ss << "@@ -" << first << "," << removed.size()
       << " +" << first << "," << added.size() << " @@\n";
    for (auto line : removed) ss << "-" << line << "\n";
    for (auto line : added) ss << "+" << line << "\n";
    return ss.str();
}

nlohmann::json report_json(const PatchResult& result, const std::string& original) {
    LineIndex index(original);

    nlohmann::json blocks = nlohmann::json::array();
    for (size_t i = 0; i < result.applied_blocks.size(); ++i) {
        const auto& block = result.applied_blocks[i];
        const auto& o = block.outcome;

        nlohmann::json b = {
            {"number", i + 1},
            {"order_index", block.instruction.order_index},
            {"status", status_label(o.status)},
            {"badge", badge_text(block)},
            {"confidence", o.confidence},
            {"failure", failure_name(o.failure)}
        };
        if (block.instruction.line_hint) {
            b["line_hint"] = *block.instruction.line_hint;
        } else {
            b["line_hint"] = nullptr;
        }
        if (o.span) {
            LineRange r = lines_of(index, *o.span);
            b["span"] = {{"start", o.span->start}, {"end", o.span->end}};
            b["lines"] = {{"first", r.first}, {"last", r.last}};
        } else {
            b["span"] = nullptr;
            b["lines"] = nullptr;
        }
        blocks.push_back(std::move(b));
    }

    return {
        {"fully_applied", result.is_fully_applied()},
        {"total_applied", result.total_applied},
        {"total_failed", result.total_failed},
        {"status_message", result.status_message},
        {"blocks", std::move(blocks)}
    };
}

} // namespace patchkit
