#include "fuzzy.hpp"
#include <algorithm>
#include <cmath>

namespace patchkit {

namespace {

struct Candidate {
    double score = -1.0;
    size_t first_line = 0;
    size_t line_count = 0;
};

constexpr double kScoreEpsilon = 1e-9;

size_t distance_from(size_t value, size_t target) {
    return value > target ? value - target : target - value;
}

// Higher score wins; ties go to the earlier window, then to the window
// closest to the search's own line count.
bool better(const Candidate& a, const Candidate& b, size_t wanted_lines) {
    if (a.score > b.score + kScoreEpsilon) return true;
    if (b.score > a.score + kScoreEpsilon) return false;
    if (a.first_line != b.first_line) return a.first_line < b.first_line;
    return distance_from(a.line_count, wanted_lines) < distance_from(b.line_count, wanted_lines);
}

} // namespace

std::optional<Located> FuzzyStrategy::locate(const SourceText& source,
                                             const EditInstruction& instruction,
                                             size_t /*anchor*/) const {
    if (is_blank(instruction.search)) return std::nullopt;

    SearchLines wanted = search_lines(instruction.search);
    const size_t wanted_count = wanted.lines.size();

    std::string target;
    for (size_t i = 0; i < wanted_count; ++i) {
        if (i > 0) target += '\n';
        target += normalize_line(wanted.lines[i]);
    }

    const auto& file_lines = source.normalized_lines();
    const size_t total = file_lines.size();
    if (total == 0) return std::nullopt;

    // prefix[i] = combined length of the first i normalized lines
    std::vector<size_t> prefix(total + 1, 0);
    for (size_t i = 0; i < total; ++i) {
        prefix[i + 1] = prefix[i] + file_lines[i].size();
    }

    size_t min_lines = wanted_count > window_tolerance_ ? wanted_count - window_tolerance_ : 1;
    size_t max_lines = std::min(total, wanted_count + window_tolerance_);

    Candidate best;
    std::string window;
    for (size_t count = min_lines; count <= max_lines; ++count) {
        for (size_t first = 0; first + count <= total; ++first) {
            size_t window_len = prefix[first + count] - prefix[first] + (count - 1);

            // Length difference alone already rules the window out
            size_t longest = std::max(window_len, target.size());
            auto allowed = static_cast<size_t>(
                (1.0 - threshold_) * static_cast<double>(longest) + kScoreEpsilon);
            if (distance_from(window_len, target.size()) > allowed) continue;

            window.clear();
            for (size_t i = first; i < first + count; ++i) {
                if (i > first) window += '\n';
                window += file_lines[i];
            }

            auto score = similarity(window, target, threshold_);
            if (!score) continue;

            Candidate c{*score, first, count};
            if (better(c, best, wanted_count)) best = c;
        }
    }

    if (best.score < 0.0) return std::nullopt;

    Span span = line_span(source.lines(), best.first_line,
                          best.first_line + best.line_count - 1, wanted.ends_with_newline);
    return Located{span, best.score};
}

} // namespace patchkit
