#include "text.hpp"

#include <algorithm>
#include <cctype>

namespace patchkit {

// ── LineIndex ────────────────────────────────────────────────────

LineIndex::LineIndex(std::string_view text) : text_(text) {
    if (text_.empty()) return;
    starts_.push_back(0);
    for (size_t i = 0; i < text_.size(); ++i) {
        if (text_[i] == '\n' && i + 1 < text_.size()) {
            starts_.push_back(i + 1);
        }
    }
}

size_t LineIndex::line_start(size_t line) const {
    if (line >= starts_.size()) return text_.size();
    return starts_[line];
}

size_t LineIndex::line_end(size_t line) const {
    if (line >= starts_.size()) return text_.size();
    size_t end = (line + 1 < starts_.size()) ? starts_[line + 1] : text_.size();
    if (end > starts_[line] && text_[end - 1] == '\n') --end;
    if (end > starts_[line] && text_[end - 1] == '\r') --end;
    return end;
}

size_t LineIndex::line_end_with_newline(size_t line) const {
    if (line + 1 < starts_.size()) return starts_[line + 1];
    return text_.size();
}

size_t LineIndex::line_of(size_t offset) const {
    if (starts_.empty()) return 0;
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    return static_cast<size_t>(it - starts_.begin()) - 1;
}

std::string_view LineIndex::line(size_t line) const {
    size_t start = line_start(line);
    return text_.substr(start, line_end(line) - start);
}

// ── Normalization ────────────────────────────────────────────────

static bool is_hspace(char c) {
    return c == ' ' || c == '\t';
}

Span NormalizedText::to_source(size_t begin, size_t end) const {
    if (begin >= end || end > text.size()) return Span{};
    return Span{src_begin[begin], src_end[end - 1]};
}

NormalizedText normalize_whitespace(std::string_view text) {
    NormalizedText out;
    out.text.reserve(text.size());
    out.src_begin.reserve(text.size());
    out.src_end.reserve(text.size());

    auto emit = [&out](char c, size_t from, size_t to) {
        out.text += c;
        out.src_begin.push_back(from);
        out.src_end.push_back(to);
    };

    size_t i = 0;
    const size_t n = text.size();
    bool at_line_start = true;
    while (i < n) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            size_t len = (c == '\r' && i + 1 < n && text[i + 1] == '\n') ? 2 : 1;
            emit('\n', i, i + len);
            i += len;
            at_line_start = true;
            continue;
        }
        if (is_hspace(c)) {
            size_t j = i;
            while (j < n && is_hspace(text[j])) ++j;
            bool trailing = j == n || text[j] == '\n' || text[j] == '\r';
            if (!at_line_start && !trailing) emit(' ', i, j);
            i = j;
            continue;
        }
        emit(c, i, i + 1);
        at_line_start = false;
        ++i;
    }
    return out;
}

std::string normalize_line(std::string_view line) {
    return normalize_whitespace(line).text;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (true) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// ── Line-number prefixes ─────────────────────────────────────────

// Length of a leading "N| " prefix (1-5 digits), or 0
static size_t line_prefix_length(std::string_view line) {
    size_t digits = 0;
    while (digits < line.size() && digits < 6 &&
           std::isdigit(static_cast<unsigned char>(line[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits > 5) return 0;
    if (digits + 1 >= line.size() || line[digits] != '|') return 0;
    if (!std::isspace(static_cast<unsigned char>(line[digits + 1]))) return 0;
    return digits + 2;
}

StrippedText strip_line_number_prefixes(const std::string& text) {
    StrippedText result;
    result.text = text;
    if (is_blank(text)) return result;

    auto lines = split_lines(text);
    size_t matches = std::count_if(lines.begin(), lines.end(),
        [](std::string_view l) { return line_prefix_length(l) > 0; });
    if (matches <= lines.size() / 2) return result;

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string_view line = lines[i];
        size_t len = line_prefix_length(line);
        if (len > 0 && !result.first_line) {
            result.first_line = static_cast<uint32_t>(
                std::stoul(std::string(line.substr(0, len - 2))));
        }
        out.append(line.substr(len));
        if (i + 1 < lines.size()) out += '\n';
    }
    result.text = std::move(out);
    result.stripped = true;
    return result;
}

// ── Similarity ───────────────────────────────────────────────────

std::optional<size_t> bounded_edit_distance(std::string_view a, std::string_view b,
                                            size_t max_dist) {
    const size_t n = a.size();
    const size_t m = b.size();
    const size_t diff = n > m ? n - m : m - n;
    if (diff > max_dist) return std::nullopt;
    if (n == 0) return m;
    if (m == 0) return n;

    const size_t inf = max_dist + 1;
    std::vector<size_t> prev(m + 1, inf);
    std::vector<size_t> cur(m + 1, inf);
    for (size_t j = 0; j <= std::min(m, max_dist); ++j) prev[j] = j;

    for (size_t i = 1; i <= n; ++i) {
        size_t lo = i > max_dist ? i - max_dist : 1;
        size_t hi = std::min(m, i + max_dist);

        cur[lo - 1] = (lo == 1 && i <= max_dist) ? i : inf;
        size_t row_min = cur[lo - 1];
        for (size_t j = lo; j <= hi; ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            size_t v = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
            cur[j] = std::min(v, inf);
            row_min = std::min(row_min, cur[j]);
        }
        // Next row reads one column past this band
        if (hi + 1 <= m) cur[hi + 1] = inf;

        if (row_min > max_dist) return std::nullopt;
        std::swap(prev, cur);
    }

    if (prev[m] > max_dist) return std::nullopt;
    return prev[m];
}

std::optional<double> similarity(std::string_view a, std::string_view b, double min_score) {
    const size_t max_len = std::max(a.size(), b.size());
    if (max_len == 0) return 1.0;

    double slack = (1.0 - std::clamp(min_score, 0.0, 1.0)) * static_cast<double>(max_len);
    auto max_dist = static_cast<size_t>(slack + 1e-9);
    auto dist = bounded_edit_distance(a, b, max_dist);
    if (!dist) return std::nullopt;

    double score = 1.0 - static_cast<double>(*dist) / static_cast<double>(max_len);
    if (score + 1e-12 < min_score) return std::nullopt;
    return score;
}

} // namespace patchkit
