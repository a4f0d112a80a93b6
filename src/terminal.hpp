#pragma once

#include <string>

namespace memomark {
namespace terminal {

// stdout is an interactive terminal.
bool is_tty();

// Colors are usable on stdout: a TTY, TERM set and not "dumb", NO_COLOR unset.
bool supports_color();

/**
 * Columns taken by text on screen.
 *
 * Escape sequences (CSI "ESC [ ... letter" and OSC "ESC ] ... BEL|ESC \")
 * take none, each UTF-8 codepoint takes one, and line breaks take none.
 */
int display_width(const std::string& text);

// text with every escape sequence removed.
std::string strip_ansi(const std::string& text);

// Clears the screen and homes the cursor, for redrawing in watch mode.
std::string redraw_prefix();

} // namespace terminal
} // namespace memomark
