#include <catch2/catch_test_macros.hpp>
#include "block_parser.hpp"
#include <vector>

using namespace patchkit;

// Helper: collect the instructions emitted while feeding one chunk
static std::vector<EditInstruction> collect(BlockParser& parser, const std::string& chunk) {
    std::vector<EditInstruction> out;
    parser.feed(chunk, [&](const EditInstruction& ins) { out.push_back(ins); });
    return out;
}

static const char* kTwoBlocks =
    "Here are the edits.\n"
    "<<<SEARCH>>>\n"
    "int a = 1;\n"
    "<<<REPLACE>>>\n"
    "int a = 2;\n"
    "<<<END>>>\n"
    "\n"
    "# near line 20\n"
    "<<<SEARCH>>>\n"
    "    return a;\n"
    "<<<REPLACE>>>\n"
    "<<<END>>>\n";

// ── Marker grammar ───────────────────────────────────────────────

TEST_CASE("parse_reply: empty reply yields no instructions", "[parser]") {
    auto r = parse_reply("");
    REQUIRE(r.empty());
    REQUIRE(r.diagnostics.empty());
    REQUIRE(r.summary.empty());
}

TEST_CASE("parse_reply: prose without blocks yields no instructions", "[parser]") {
    auto r = parse_reply("No changes are needed.\n");
    REQUIRE(r.empty());
    REQUIRE(r.diagnostics.empty());
}

TEST_CASE("parse_reply: single block", "[parser]") {
    auto r = parse_reply("<<<SEARCH>>>\nfoo\n<<<REPLACE>>>\nbar\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "foo");
    REQUIRE(r.instructions[0].replace == "bar");
    REQUIRE(r.instructions[0].order_index == 0);
    REQUIRE_FALSE(r.instructions[0].line_hint.has_value());
}

TEST_CASE("parse_reply: blocks keep order, hints and empty replace", "[parser]") {
    auto r = parse_reply(kTwoBlocks);
    REQUIRE(r.instructions.size() == 2);
    REQUIRE(r.diagnostics.empty());

    REQUIRE(r.instructions[0].order_index == 0);
    REQUIRE_FALSE(r.instructions[0].line_hint.has_value());

    REQUIRE(r.instructions[1].order_index == 1);
    REQUIRE(r.instructions[1].search == "    return a;");
    REQUIRE(r.instructions[1].replace.empty());
    REQUIRE(r.instructions[1].line_hint == std::optional<uint32_t>(20));
}

TEST_CASE("parse_reply: multi-line sections keep inner blank lines", "[parser]") {
    auto r = parse_reply("<<<SEARCH>>>\na\n\nb\n<<<REPLACE>>>\nc\n<<<END>>>");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "a\n\nb");
}

TEST_CASE("parse_reply: empty search section is an insertion", "[parser]") {
    auto r = parse_reply("<<<SEARCH>>>\n<<<REPLACE>>>\nnew line\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search.empty());
    REQUIRE(r.instructions[0].replace == "new line");
}

TEST_CASE("parse_reply: hint separated by prose is discarded", "[parser]") {
    auto r = parse_reply("# near line 5\nSome explanation.\n"
                         "<<<SEARCH>>>\nx\n<<<REPLACE>>>\ny\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE_FALSE(r.instructions[0].line_hint.has_value());
}

TEST_CASE("parse_reply: markers tolerate surrounding whitespace and CRLF", "[parser]") {
    auto r = parse_reply("  <<<SEARCH>>>  \r\nfoo\r\n<<<REPLACE>>>\r\nbar\r\n<<<END>>>\r\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "foo");
    REQUIRE(r.instructions[0].replace == "bar");
}

// ── Malformed blocks ─────────────────────────────────────────────

TEST_CASE("parse_reply: unterminated block is dropped with a diagnostic", "[parser]") {
    auto r = parse_reply("<<<SEARCH>>>\nfoo\n<<<REPLACE>>>\nbar\n");
    REQUIRE(r.empty());
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].line == 1);
}

TEST_CASE("parse_reply: stray markers are reported, later blocks survive", "[parser]") {
    auto r = parse_reply("<<<REPLACE>>>\n<<<END>>>\n"
                         "<<<SEARCH>>>\nfoo\n<<<REPLACE>>>\nbar\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].order_index == 0);
    REQUIRE(r.diagnostics.size() == 2);
    REQUIRE(r.diagnostics[0].line == 1);
    REQUIRE(r.diagnostics[1].line == 2);
}

TEST_CASE("parse_reply: new SEARCH before END drops the open block", "[parser]") {
    auto r = parse_reply("<<<SEARCH>>>\nold\n<<<REPLACE>>>\nnew\n"
                         "<<<SEARCH>>>\nfoo\n<<<REPLACE>>>\nbar\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "foo");
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].line == 1);
}

TEST_CASE("parse_reply: block without REPLACE is dropped", "[parser]") {
    auto r = parse_reply("<<<SEARCH>>>\nfoo\n<<<END>>>\n");
    REQUIRE(r.empty());
    REQUIRE(r.diagnostics.size() == 1);
}

// ── Line-number prefixes ─────────────────────────────────────────

TEST_CASE("parse_reply: copied line numbers are stripped and become the hint", "[parser]") {
    auto r = parse_reply("<<<SEARCH>>>\n10| int a;\n11| int b;\n"
                         "<<<REPLACE>>>\n10| int a = 0;\n11| int b;\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "int a;\nint b;");
    REQUIRE(r.instructions[0].replace == "int a = 0;\nint b;");
    REQUIRE(r.instructions[0].line_hint == std::optional<uint32_t>(10));
}

TEST_CASE("parse_reply: explicit hint wins over copied line numbers", "[parser]") {
    auto r = parse_reply("// line 3\n<<<SEARCH>>>\n10| int a;\n<<<REPLACE>>>\nx\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].line_hint == std::optional<uint32_t>(3));
}

// ── XML grammar ──────────────────────────────────────────────────

TEST_CASE("parse_reply: XML blocks and summary", "[parser]") {
    auto r = parse_reply(
        "<edits>\n"
        "<block>\n"
        "<search>\n"
        "val oldName = 1\n"
        "</search>\n"
        "<replace>\n"
        "val newName = 1\n"
        "</replace>\n"
        "</block>\n"
        "</edits>\n"
        "<summary> Renamed oldName </summary>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "val oldName = 1");
    REQUIRE(r.instructions[0].replace == "val newName = 1");
    REQUIRE(r.summary == "Renamed oldName");
}

TEST_CASE("parse_reply: inline XML block with line attribute", "[parser]") {
    auto r = parse_reply("<block line=\"7\"><search>a</search><replace>b</replace></block>"
                         "<block><search>c</search><replace></replace></block>");
    REQUIRE(r.instructions.size() == 2);
    REQUIRE(r.instructions[0].search == "a");
    REQUIRE(r.instructions[0].line_hint == std::optional<uint32_t>(7));
    REQUIRE(r.instructions[1].search == "c");
    REQUIRE(r.instructions[1].replace.empty());
    REQUIRE(r.instructions[1].order_index == 1);
}

TEST_CASE("parse_reply: XML block missing replace is dropped", "[parser]") {
    auto r = parse_reply("<block><search>a</search></block>\n"
                         "<block><search>c</search><replace>d</replace></block>");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "c");
    REQUIRE(r.diagnostics.size() == 1);
    REQUIRE(r.diagnostics[0].line == 1);
}

TEST_CASE("parse_reply: unterminated XML block is reported", "[parser]") {
    auto r = parse_reply("<block>\n<search>\nx\n</search>\n<replace>\ny\n");
    REQUIRE(r.empty());
    REQUIRE(r.diagnostics.size() == 1);
}

TEST_CASE("parse_reply: first opening token picks the grammar", "[parser]") {
    // Marker block whose content mentions an XML tag
    auto r = parse_reply("<<<SEARCH>>>\n<block>\n<<<REPLACE>>>\n<section>\n<<<END>>>\n");
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "<block>");
    REQUIRE(r.instructions[0].replace == "<section>");
}

// ── Streaming ────────────────────────────────────────────────────

TEST_CASE("BlockParser: emits each block once its END line is complete", "[parser]") {
    BlockParser parser;

    auto first = collect(parser, "<<<SEARCH>>>\nfoo\n<<<REPLACE>>>\nbar\n<<<END>>>");
    REQUIRE(first.empty());

    auto second = collect(parser, "\n<<<SEARCH>>>\nba");
    REQUIRE(second.size() == 1);
    REQUIRE(second[0].search == "foo");

    auto third = collect(parser, "z\n<<<REPLACE>>>\nqux\n<<<END>>>\n");
    REQUIRE(third.size() == 1);
    REQUIRE(third[0].search == "baz");
    REQUIRE(third[0].order_index == 1);

    const auto& result = parser.finish();
    REQUIRE(result.instructions.size() == 2);
    REQUIRE(result.diagnostics.empty());
}

TEST_CASE("BlockParser: byte-by-byte feeding matches one-shot parsing", "[parser]") {
    BlockParser parser;
    size_t callbacks = 0;
    std::string reply = kTwoBlocks;
    for (char c : reply) {
        parser.feed(std::string(1, c), [&](const EditInstruction&) { ++callbacks; });
    }
    const auto& streamed = parser.finish([&](const EditInstruction&) { ++callbacks; });
    auto oneshot = parse_reply(reply);

    REQUIRE(callbacks == 2);
    REQUIRE(streamed.instructions.size() == oneshot.instructions.size());
    for (size_t i = 0; i < oneshot.instructions.size(); ++i) {
        REQUIRE(streamed.instructions[i].search == oneshot.instructions[i].search);
        REQUIRE(streamed.instructions[i].replace == oneshot.instructions[i].replace);
        REQUIRE(streamed.instructions[i].line_hint == oneshot.instructions[i].line_hint);
    }
}

TEST_CASE("BlockParser: finish emits a block ending without newline", "[parser]") {
    BlockParser parser;
    auto fed = collect(parser, "<<<SEARCH>>>\na\n<<<REPLACE>>>\nb\n<<<END>>>");
    REQUIRE(fed.empty());

    size_t emitted = 0;
    parser.finish([&](const EditInstruction&) { ++emitted; });
    REQUIRE(emitted == 1);
}

TEST_CASE("BlockParser: reset clears state", "[parser]") {
    BlockParser parser;
    collect(parser, "<<<SEARCH>>>\nfoo\n");
    parser.reset();
    collect(parser, "<<<SEARCH>>>\na\n<<<REPLACE>>>\nb\n<<<END>>>\n");
    const auto& r = parser.finish();
    REQUIRE(r.instructions.size() == 1);
    REQUIRE(r.instructions[0].search == "a");
    REQUIRE(r.diagnostics.empty());
}

// ── parse_line_hint ──────────────────────────────────────────────

TEST_CASE("parse_line_hint: accepted forms", "[parser]") {
    REQUIRE(parse_line_hint("# near line 42") == std::optional<uint32_t>(42));
    REQUIRE(parse_line_hint("// line 7") == std::optional<uint32_t>(7));
    REQUIRE(parse_line_hint("  # Line: 3") == std::optional<uint32_t>(3));
}

TEST_CASE("parse_line_hint: rejected forms", "[parser]") {
    REQUIRE_FALSE(parse_line_hint("# no hint here").has_value());
    REQUIRE_FALSE(parse_line_hint("line 5").has_value());
    REQUIRE_FALSE(parse_line_hint("# line 0").has_value());
    REQUIRE_FALSE(parse_line_hint("# line x").has_value());
}
