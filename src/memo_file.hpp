#pragma once

#include <istream>
#include <string>

namespace memomark {

// Reads a whole memo file. Throws std::runtime_error if it cannot be read.
std::string read_memo(const std::string& path);

// Reads everything remaining in a stream (stdin for "-").
std::string read_memo(std::istream& in);

} // namespace memomark
