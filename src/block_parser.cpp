#include "block_parser.hpp"
#include "text.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>

namespace patchkit {

namespace {

constexpr std::string_view kSearchMarker = "<<<SEARCH>>>";
constexpr std::string_view kReplaceMarker = "<<<REPLACE>>>";
constexpr std::string_view kEndMarker = "<<<END>>>";

struct ScanResult {
    std::vector<EditInstruction> instructions;
    std::vector<ParseDiagnostic> diagnostics;
};

std::string_view trim_view(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string join_lines(const std::vector<std::string_view>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out.append(lines[i]);
    }
    return out;
}

EditInstruction make_instruction(const std::string& search, const std::string& replace,
                                 std::optional<uint32_t> hint, size_t order_index) {
    StrippedText s = strip_line_number_prefixes(search);
    StrippedText r = strip_line_number_prefixes(replace);

    EditInstruction ins;
    ins.search = std::move(s.text);
    ins.replace = std::move(r.text);
    ins.order_index = order_index;
    ins.line_hint = hint ? hint : (s.stripped ? s.first_line : std::nullopt);
    return ins;
}

// Offset of the first line consisting of the marker, or npos
size_t find_marker_line(std::string_view text, std::string_view marker) {
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = nl == std::string_view::npos ? text.size() : nl;
        if (trim_view(text.substr(pos, end - pos)) == marker) return pos;
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return std::string_view::npos;
}

// "<block" followed by '>' or whitespace; "<blocks>" does not count
size_t find_block_tag(std::string_view text, size_t from) {
    size_t pos = from;
    while ((pos = text.find("<block", pos)) != std::string_view::npos) {
        size_t after = pos + 6;
        if (after < text.size() &&
            (text[after] == '>' || std::isspace(static_cast<unsigned char>(text[after])))) {
            return pos;
        }
        pos = after;
    }
    return std::string_view::npos;
}

// ── Marker grammar ───────────────────────────────────────────────

ScanResult scan_markers(std::string_view text, bool at_end) {
    enum class State { Outside, InSearch, InReplace };

    ScanResult out;
    State state = State::Outside;
    size_t block_line = 0;
    std::optional<uint32_t> pending_hint;
    std::optional<uint32_t> block_hint;
    std::vector<std::string_view> search;
    std::vector<std::string_view> replace;

    auto drop = [&](const std::string& why) {
        out.diagnostics.push_back({block_line, why});
        search.clear();
        replace.clear();
        state = State::Outside;
    };

    auto lines = split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string_view raw = lines[i];
        if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);
        std::string_view t = trim_view(raw);
        const size_t line_no = i + 1;

        if (t == kSearchMarker) {
            if (state != State::Outside) {
                drop("block missing " + std::string(state == State::InSearch ? kReplaceMarker
                                                                              : kEndMarker)
                     + ", dropped");
            }
            state = State::InSearch;
            block_line = line_no;
            block_hint = pending_hint;
            pending_hint.reset();
        } else if (t == kReplaceMarker) {
            if (state == State::InSearch) {
                state = State::InReplace;
            } else if (state == State::InReplace) {
                drop("duplicate " + std::string(kReplaceMarker) + ", block dropped");
            } else {
                out.diagnostics.push_back({line_no, "stray " + std::string(kReplaceMarker)});
            }
        } else if (t == kEndMarker) {
            if (state == State::InReplace) {
                out.instructions.push_back(make_instruction(
                    join_lines(search), join_lines(replace), block_hint,
                    out.instructions.size()));
                search.clear();
                replace.clear();
                state = State::Outside;
            } else if (state == State::InSearch) {
                drop("block missing " + std::string(kReplaceMarker) + ", dropped");
            } else {
                out.diagnostics.push_back({line_no, "stray " + std::string(kEndMarker)});
            }
        } else if (state == State::InSearch) {
            search.push_back(raw);
        } else if (state == State::InReplace) {
            replace.push_back(raw);
        } else if (!t.empty()) {
            // Only a hint directly above a block (blank lines aside) counts
            pending_hint = parse_line_hint(std::string(t));
        }
    }

    if (at_end && state != State::Outside) {
        drop("unterminated block at end of reply, dropped");
    }
    return out;
}

// ── XML grammar ──────────────────────────────────────────────────

// Drop one leading and one trailing line break
std::string trim_tag_newlines(std::string_view s) {
    if (s.substr(0, 2) == "\r\n") s.remove_prefix(2);
    else if (!s.empty() && s.front() == '\n') s.remove_prefix(1);

    if (s.size() >= 2 && s.substr(s.size() - 2) == "\r\n") s.remove_suffix(2);
    else if (!s.empty() && s.back() == '\n') s.remove_suffix(1);
    return std::string(s);
}

std::optional<uint32_t> parse_line_attribute(std::string_view attrs) {
    size_t pos = attrs.find("line");
    if (pos == std::string_view::npos) return std::nullopt;
    pos += 4;
    while (pos < attrs.size() && (attrs[pos] == '=' || attrs[pos] == '"' || attrs[pos] == '\''
                                  || std::isspace(static_cast<unsigned char>(attrs[pos])))) {
        ++pos;
    }
    size_t digits = 0;
    while (pos + digits < attrs.size() && digits < 9 &&
           std::isdigit(static_cast<unsigned char>(attrs[pos + digits]))) {
        ++digits;
    }
    if (digits == 0) return std::nullopt;
    auto value = static_cast<uint32_t>(std::stoul(std::string(attrs.substr(pos, digits))));
    if (value == 0) return std::nullopt;
    return value;
}

ScanResult scan_xml(std::string_view text, bool at_end) {
    constexpr std::string_view kBlockClose = "</block>";
    constexpr std::string_view kSearchOpen = "<search>";
    constexpr std::string_view kSearchClose = "</search>";
    constexpr std::string_view kReplaceOpen = "<replace>";
    constexpr std::string_view kReplaceClose = "</replace>";
    constexpr auto npos = std::string_view::npos;

    ScanResult out;
    LineIndex index(text);
    auto line_at = [&index](size_t offset) { return index.line_of(offset) + 1; };

    size_t pos = 0;
    size_t open;
    while ((open = find_block_tag(text, pos)) != npos) {
        size_t tag_end = text.find('>', open);
        if (tag_end == npos) {
            if (at_end) out.diagnostics.push_back({line_at(open), "unterminated <block> tag"});
            break;
        }
        auto hint = parse_line_attribute(text.substr(open + 6, tag_end - open - 6));

        // Everything up to the next </block> belongs to this block unless a
        // <search> section opens first and swallows it.
        size_t s_open = text.find(kSearchOpen, tag_end);
        size_t first_close = text.find(kBlockClose, tag_end);
        if (s_open == npos || (first_close != npos && first_close < s_open)) {
            if (first_close == npos) {
                if (at_end) out.diagnostics.push_back({line_at(open), "unterminated <block>"});
                break;
            }
            out.diagnostics.push_back({line_at(open), "block without <search>, dropped"});
            pos = first_close + kBlockClose.size();
            continue;
        }

        size_t s_body = s_open + kSearchOpen.size();
        size_t s_close = text.find(kSearchClose, s_body);
        if (s_close == npos) {
            if (at_end) out.diagnostics.push_back({line_at(open), "unterminated <search>"});
            break;
        }

        size_t after_search = s_close + kSearchClose.size();
        size_t r_open = text.find(kReplaceOpen, after_search);
        size_t next_close = text.find(kBlockClose, after_search);
        if (r_open == npos || (next_close != npos && next_close < r_open)) {
            if (next_close == npos) {
                if (at_end) out.diagnostics.push_back({line_at(open), "unterminated <block>"});
                break;
            }
            out.diagnostics.push_back({line_at(open), "block without <replace>, dropped"});
            pos = next_close + kBlockClose.size();
            continue;
        }

        size_t r_body = r_open + kReplaceOpen.size();
        size_t r_close = text.find(kReplaceClose, r_body);
        size_t block_close = r_close == npos
            ? npos : text.find(kBlockClose, r_close + kReplaceClose.size());
        if (block_close == npos) {
            if (at_end) out.diagnostics.push_back({line_at(open), "unterminated <block>"});
            break;
        }

        out.instructions.push_back(make_instruction(
            trim_tag_newlines(text.substr(s_body, s_close - s_body)),
            trim_tag_newlines(text.substr(r_body, r_close - r_body)),
            hint, out.instructions.size()));
        pos = block_close + kBlockClose.size();
    }
    return out;
}

std::string extract_summary(std::string_view text) {
    size_t open = text.find("<summary>");
    if (open == std::string_view::npos) return {};
    open += 9;
    size_t close = text.find("</summary>", open);
    if (close == std::string_view::npos) return {};
    return std::string(trim_view(text.substr(open, close - open)));
}

ScanResult scan(std::string_view text, bool at_end) {
    size_t marker_at = find_marker_line(text, kSearchMarker);
    size_t block_at = find_block_tag(text, 0);
    if (block_at != std::string_view::npos && block_at < marker_at) {
        return scan_xml(text, at_end);
    }
    return scan_markers(text, at_end);
}

} // namespace

std::optional<uint32_t> parse_line_hint(const std::string& line) {
    std::string t = to_lower(trim(line));
    if (t.rfind("#", 0) != 0 && t.rfind("//", 0) != 0) return std::nullopt;

    size_t pos = t.find("line");
    if (pos == std::string::npos) return std::nullopt;
    pos += 4;
    while (pos < t.size() && (t[pos] == ' ' || t[pos] == ':' || t[pos] == '\t')) ++pos;

    size_t digits = 0;
    while (pos + digits < t.size() && digits < 9 &&
           std::isdigit(static_cast<unsigned char>(t[pos + digits]))) {
        ++digits;
    }
    if (digits == 0) return std::nullopt;
    auto value = static_cast<uint32_t>(std::stoul(t.substr(pos, digits)));
    if (value == 0) return std::nullopt;
    return value;
}

void BlockParser::feed(const std::string& chunk, const InstructionCallback& callback) {
    buffer_ += chunk;

    // A marker line is only final once its newline has arrived
    size_t last_nl = buffer_.rfind('\n');
    if (last_nl == std::string::npos) return;

    ScanResult partial = scan(std::string_view(buffer_).substr(0, last_nl + 1), false);
    for (size_t i = emitted_; i < partial.instructions.size(); ++i) {
        reply_.instructions.push_back(partial.instructions[i]);
        if (callback) callback(partial.instructions[i]);
    }
    emitted_ = std::max(emitted_, partial.instructions.size());
}

const ParsedReply& BlockParser::finish(const InstructionCallback& callback) {
    ScanResult full = scan(buffer_, true);
    for (size_t i = emitted_; i < full.instructions.size(); ++i) {
        if (callback) callback(full.instructions[i]);
    }
    emitted_ = full.instructions.size();

    reply_.instructions = std::move(full.instructions);
    reply_.diagnostics = std::move(full.diagnostics);
    reply_.summary = extract_summary(buffer_);
    return reply_;
}

void BlockParser::reset() {
    buffer_.clear();
    emitted_ = 0;
    reply_ = ParsedReply{};
}

ParsedReply parse_reply(const std::string& reply) {
    BlockParser parser;
    parser.feed(reply, {});
    return parser.finish();
}

} // namespace patchkit
