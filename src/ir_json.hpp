#pragma once

/**
 * JSON form of the render IR and of inline matches.
 *
 * Used by `--json`, `--inline` and the HTTP preview API. Inline runs become
 * arrays of segments:
 *
 *   {"type": "text", "text": "..."}
 *   {"type": "bold", "text": "...", "start": 4, "end": 12}
 *   {"type": "link", "text": "...", "url": "...", "start": 0, "end": 30}
 *
 * Blocks carry "type", "start_line" and "end_line" plus their own fields.
 */

#include "markdown/render_ir.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace memomark {

nlohmann::json to_json(const markdown::InlineMatch& match);
nlohmann::json to_json(const markdown::InlineRun& run);
nlohmann::json to_json(const markdown::RenderBlock& block);
nlohmann::json to_json(const markdown::RenderDocument& doc);

// Flat array of matches, as returned by parse_inline().
nlohmann::json matches_to_json(const std::vector<markdown::InlineMatch>& matches);

} // namespace memomark
