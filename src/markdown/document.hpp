#pragma once

/**
 * Document scanner: turns a memo into its block sequence.
 *
 * The scanner walks the lines with a cursor. At each line it tries the block
 * parsers in priority order; the first that matches flushes the pending
 * paragraph, contributes its node and moves the cursor past its span. Lines
 * no parser claims collect in a paragraph buffer.
 *
 * Every line of the input belongs to exactly one block span. A buffer made
 * only of blank lines emits no paragraph; its lines are folded into the span
 * of the next block, or of the last block at end of input.
 */

#include "types.hpp"
#include <string>
#include <vector>

namespace memomark::markdown {

// Scans pre-split lines into blocks. Never throws.
std::vector<BlockNode> scan(const std::vector<std::string>& lines);

// Splits text on '\n' and scans it.
Document parse(const std::string& text);

} // namespace memomark::markdown
