#pragma once
#include "edit.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace patchkit {

// A fragment of the reply that was dropped instead of parsed
struct ParseDiagnostic {
    size_t line = 0;  // 1-based line in the reply where the fragment starts
    std::string message;
};

struct ParsedReply {
    std::vector<EditInstruction> instructions;
    std::vector<ParseDiagnostic> diagnostics;
    std::string summary;  // <summary> text, empty if absent

    bool empty() const { return instructions.empty(); }
};

// Callback receives each edit instruction as soon as its block is complete
using InstructionCallback = std::function<void(const EditInstruction& instruction)>;

// Extracts edit instructions from a model reply. Two block grammars are
// understood; the one whose opening token comes first is used:
//
//   # near line 42          <block line="42">
//   <<<SEARCH>>>            <search>...</search>
//   ...                     <replace>...</replace>
//   <<<REPLACE>>>           </block>
//   ...
//   <<<END>>>
//
// The reply may be fed in chunks while it streams; finish() yields the
// same result parse_reply() would for the concatenated input.
class BlockParser {
public:
    // Feed a raw chunk; only complete lines are examined
    void feed(const std::string& chunk, const InstructionCallback& callback);

    // End of input: emit what is left and record diagnostics
    const ParsedReply& finish(const InstructionCallback& callback = {});

    const ParsedReply& result() const { return reply_; }

    // Reset parser state
    void reset();

private:
    std::string buffer_;
    size_t emitted_ = 0;
    ParsedReply reply_;
};

ParsedReply parse_reply(const std::string& reply);

// Parse a hint comment such as "# near line 42" or "// line 7"
std::optional<uint32_t> parse_line_hint(const std::string& line);

} // namespace patchkit
