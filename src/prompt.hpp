#pragma once
#include <cstddef>
#include <string>

namespace patchkit {

// System prompt asking the model for <<<SEARCH>>>/<<<REPLACE>>>/<<<END>>>
// blocks. With line_numbers set it also warns against copying "N| "
// prefixes into the blocks.
std::string build_edit_system_prompt(bool line_numbers);

// User message: file name, fenced file content (optionally with "N| "
// prefixes), then the user's instructions.
std::string build_edit_user_message(const std::string& content,
                                    const std::string& file_name,
                                    const std::string& instructions,
                                    bool line_numbers);

// Large files get line-number prefixes so the model can cite positions
bool should_number_lines(const std::string& content, size_t threshold);

} // namespace patchkit
