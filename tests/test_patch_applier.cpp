#include <catch2/catch_test_macros.hpp>
#include "patch_applier.hpp"

using namespace patchkit;

static EditInstruction make_ins(const std::string& search, const std::string& replace,
                                size_t order_index = 0,
                                std::optional<uint32_t> hint = std::nullopt) {
    EditInstruction ins;
    ins.search = search;
    ins.replace = replace;
    ins.order_index = order_index;
    ins.line_hint = hint;
    return ins;
}

static const std::string kAdd = "fn add(a,b){ return a+b }";

// ── Basic properties ─────────────────────────────────────────────

TEST_CASE("PatchApplier: no instructions leaves text untouched", "[applier]") {
    auto r = apply_edits("some text\n", {});
    REQUIRE(r.new_content == "some text\n");
    REQUIRE(r.total_applied == 0);
    REQUIRE(r.total_failed == 0);
    REQUIRE(r.is_fully_applied());
    REQUIRE(r.status_message == "No changes");
}

TEST_CASE("PatchApplier: single exact replacement", "[applier]") {
    auto r = apply_edits(kAdd, {make_ins("a+b", "a + b")});
    REQUIRE(r.new_content == "fn add(a,b){ return a + b }");
    REQUIRE(r.applied_blocks.size() == 1);
    REQUIRE(r.applied_blocks[0].outcome.status == MatchStatus::Exact);
    REQUIRE(r.total_applied == 1);
    REQUIRE(r.is_fully_applied());
    REQUIRE(r.status_message == "1/1 edits applied");
}

TEST_CASE("PatchApplier: unmatched search leaves text unchanged", "[applier]") {
    auto r = apply_edits(kAdd, {make_ins("nonexistent_token", "x")});
    REQUIRE(r.new_content == kAdd);
    REQUIRE(r.applied_blocks[0].outcome.status == MatchStatus::NotFound);
    REQUIRE(r.applied_blocks[0].outcome.failure == FailureReason::NoMatch);
    REQUIRE_FALSE(r.is_fully_applied());
    REQUIRE(r.failed_block_numbers() == std::vector<size_t>{1});
}

TEST_CASE("PatchApplier: replacing a text with itself is a no-op", "[applier]") {
    auto r = apply_edits(kAdd, {make_ins("return a+b", "return a+b")});
    REQUIRE(r.new_content == kAdd);
    REQUIRE(r.total_applied == 1);
}

TEST_CASE("PatchApplier: different indentation resolves as normalized", "[applier]") {
    std::string text = "if (x) {\n\treturn 1;\n}\n";
    auto r = apply_edits(text, {make_ins("    return 1;", "    return 2;")});
    REQUIRE(r.applied_blocks[0].outcome.status == MatchStatus::Normalized);
    REQUIRE(r.new_content == "if (x) {\n    return 2;\n}\n");
}

TEST_CASE("PatchApplier: small typo resolves as fuzzy", "[applier]") {
    std::string text = "int total = compute(a, b);\nreturn total;\n";
    auto r = apply_edits(text, {make_ins("int total = compute(a,b);",
                                         "int total = compute(b, a);")});
    REQUIRE(r.applied_blocks[0].outcome.status == MatchStatus::Fuzzy);
    REQUIRE(r.applied_blocks[0].outcome.confidence > 0.9);
    REQUIRE(r.new_content == "int total = compute(b, a);\nreturn total;\n");
}

TEST_CASE("PatchApplier: line hint is the last resort", "[applier]") {
    std::string text = "a\nb\nc\n";
    auto r = apply_edits(text, {make_ins("something else entirely", "B", 0, 2u)});
    REQUIRE(r.applied_blocks[0].outcome.status == MatchStatus::LineRange);
    REQUIRE(r.new_content == "a\nB\nc\n");
}

// ── Multiple edits ───────────────────────────────────────────────

TEST_CASE("PatchApplier: offsets refer to the original text", "[applier]") {
    auto r = apply_edits("one two three", {
        make_ins("one", "1111111", 0),
        make_ins("three", "3", 1)
    });
    REQUIRE(r.new_content == "1111111 two 3");
    REQUIRE(r.total_applied == 2);
}

TEST_CASE("PatchApplier: results follow input order", "[applier]") {
    auto r = apply_edits("alpha beta gamma", {
        make_ins("gamma", "G", 0),
        make_ins("alpha", "A", 1),
        make_ins("missing", "M", 2)
    });
    REQUIRE(r.new_content == "A beta G");
    REQUIRE(r.applied_blocks.size() == 3);
    REQUIRE(r.applied_blocks[0].instruction.search == "gamma");
    REQUIRE(r.applied_blocks[1].instruction.search == "alpha");
    REQUIRE(r.applied_blocks[2].outcome.status == MatchStatus::NotFound);
    REQUIRE(r.failed_block_numbers() == std::vector<size_t>{3});
}

TEST_CASE("PatchApplier: repeated search walks forward in order_index order", "[applier]") {
    // Input order is reversed relative to order_index
    auto r = apply_edits("x x", {
        make_ins("x", "second", 1),
        make_ins("x", "first", 0)
    });
    REQUIRE(r.new_content == "first second");
    REQUIRE(r.applied_blocks[0].outcome.span == std::optional<Span>(Span{2, 3}));
    REQUIRE(r.applied_blocks[1].outcome.span == std::optional<Span>(Span{0, 1}));
}

TEST_CASE("PatchApplier: overlapping edit loses to the earlier one", "[applier]") {
    auto r = apply_edits("alpha beta gamma", {
        make_ins("alpha beta", "X", 0),
        make_ins("beta gamma", "Y", 1)
    });
    REQUIRE(r.new_content == "X gamma");
    REQUIRE(r.applied_blocks[0].outcome.status == MatchStatus::Exact);
    REQUIRE(r.applied_blocks[1].outcome.status == MatchStatus::NotFound);
    REQUIRE(r.applied_blocks[1].outcome.failure == FailureReason::OverlapConflict);
    REQUIRE(r.total_applied == 1);
    REQUIRE(r.total_failed == 1);
    REQUIRE(r.status_message ==
            "1/2 edits applied \xe2\x80\x94 1 not found: #2 (1 overlapping)");
}

// ── Insertions and deletions ─────────────────────────────────────

TEST_CASE("PatchApplier: deletion with empty replace", "[applier]") {
    auto r = apply_edits("a\nb\nc\n", {make_ins("b\n", "")});
    REQUIRE(r.new_content == "a\nc\n");
}

TEST_CASE("PatchApplier: insertion without hint appends", "[applier]") {
    auto with_nl = apply_edits("a\n", {make_ins("", "c")});
    REQUIRE(with_nl.new_content == "a\nc\n");
    REQUIRE(with_nl.applied_blocks[0].outcome.status == MatchStatus::LineRange);

    auto without_nl = apply_edits("a\nb", {make_ins("", "c")});
    REQUIRE(without_nl.new_content == "a\nb\nc");

    auto empty = apply_edits("", {make_ins("", "first")});
    REQUIRE(empty.new_content == "first");
}

TEST_CASE("PatchApplier: insertions at one line keep instruction order", "[applier]") {
    auto r = apply_edits("a\nb\n", {
        make_ins("", "x", 0, 2u),
        make_ins("", "y", 1, 2u)
    });
    REQUIRE(r.new_content == "a\nx\ny\nb\n");
    REQUIRE(r.total_applied == 2);
}

TEST_CASE("PatchApplier: insertion at the edge of a replaced span", "[applier]") {
    auto r = apply_edits("a\nb\nc\n", {
        make_ins("", "new", 0, 2u),
        make_ins("b\n", "B\n", 1)
    });
    REQUIRE(r.new_content == "a\nnew\nB\nc\n");
    REQUIRE(r.is_fully_applied());
}

TEST_CASE("PatchApplier: engine options are honoured", "[applier]") {
    MatchOptions opts;
    opts.normalized = false;
    opts.fuzzy = false;
    opts.line_range = false;
    PatchApplier applier(opts);

    std::string text = "if (x) {\n\treturn 1;\n}\n";
    auto r = applier.apply(text, {make_ins("    return 1;", "    return 2;")});
    REQUIRE(r.new_content == text);
    REQUIRE(r.applied_blocks[0].outcome.status == MatchStatus::NotFound);
    REQUIRE_FALSE(applier.engine().options().fuzzy);
}
