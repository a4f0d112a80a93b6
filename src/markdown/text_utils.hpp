#pragma once

/**
 * Small string helpers shared by the block and inline scanners.
 */

#include <string>
#include <vector>

namespace memomark::markdown {

// Whitespace as understood by the scanners: space, tab, CR, LF, FF, VT.
bool is_space(char c);

// Returns the text with leading and trailing whitespace removed.
std::string trim(const std::string& text);

// Returns true if the text is empty or whitespace only.
bool is_blank(const std::string& text);

// Returns true if text begins with prefix.
bool starts_with(const std::string& text, const std::string& prefix);

// Splits on '\n' only. An empty string yields one empty line.
std::vector<std::string> split_lines(const std::string& text);

// Joins with '\n'.
std::string join_lines(const std::vector<std::string>& lines);

// Splits on every occurrence of sep (empty fields kept).
std::vector<std::string> split(const std::string& text, char sep);

} // namespace memomark::markdown
