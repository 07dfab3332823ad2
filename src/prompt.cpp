#include "prompt.hpp"
#include "text.hpp"
#include <sstream>

namespace patchkit {

std::string build_edit_system_prompt(bool line_numbers) {
    std::ostringstream ss;

    ss << "You are a precise code editor. Reply ONLY with search/replace blocks "
       << "for the file you are given; never rewrite the whole file.\n\n";

    ss << "Block format:\n"
       << "<<<SEARCH>>>\n"
       << "lines copied exactly from the file\n"
       << "<<<REPLACE>>>\n"
       << "the new lines\n"
       << "<<<END>>>\n\n";

    ss << "Rules:\n"
       << "1. The SEARCH section must be a character-exact copy of the file: "
       << "same indentation, spacing, punctuation and blank lines.\n"
       << "2. Each SEARCH section must match exactly one place. Include 3-7 lines of "
       << "surrounding context when a line (such as \"}\") occurs more than once.\n"
       << "3. Change only what the user asked for. Do not reformat, rename or "
       << "reorder anything else.\n"
       << "4. Use one block per separate change. Order blocks from the top of the file "
       << "to the bottom. Blocks must not share any lines.\n"
       << "5. To delete code, leave REPLACE empty. To insert code, copy the line it "
       << "goes next to into SEARCH and repeat it in REPLACE together with the new code.\n"
       << "6. Keep the indentation style of the surrounding code in REPLACE.\n"
       << "7. You may put a hint line such as \"# near line 42\" directly above a block.\n"
       << "8. No prose, no markdown fences. If nothing needs to change, reply with no blocks.\n";

    if (line_numbers) {
        ss << "\nThe file is shown with line-number prefixes in the form \"N| \" "
           << "(for example \"42| int x = 1;\"). They are for navigation only. "
           << "NEVER copy them into SEARCH or REPLACE; use a \"# near line N\" hint instead.\n";
    }

    return ss.str();
}

std::string build_edit_user_message(const std::string& content,
                                    const std::string& file_name,
                                    const std::string& instructions,
                                    bool line_numbers) {
    std::ostringstream ss;
    ss << "File: `" << file_name << "`\n\n";
    ss << "```\n";
    if (line_numbers) {
        auto lines = split_lines(content);
        // The trailing newline does not open another line
        if (lines.size() > 1 && lines.back().empty()) lines.pop_back();
        for (size_t i = 0; i < lines.size(); ++i) {
            ss << (i + 1) << "| " << lines[i] << "\n";
        }
    } else {
        ss << content;
        if (content.empty() || content.back() != '\n') ss << "\n";
    }
    ss << "```\n\n";
    ss << "Instructions:\n" << instructions << "\n";
    return ss.str();
}

bool should_number_lines(const std::string& content, size_t threshold) {
    return LineIndex(content).line_count() > threshold;
}

} // namespace patchkit
