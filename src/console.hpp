#pragma once

#include <string>

namespace memomark {

/**
 * Output channel of the CLI.
 *
 * Rendered memos and JSON go to stdout. Banners, warnings and errors go to
 * stderr, colored when stderr is a color-capable terminal.
 */
class Console {
public:
    Console();

    // --plain, or stdout redirected
    void disable_colors() { styled_ = false; }

    void print(const std::string& text) const;
    void println(const std::string& text = "") const;
    void flush() const;

    void print_error(const std::string& text) const;
    void print_warning(const std::string& text) const;
    void print_info(const std::string& text) const;
    void print_header(const std::string& text) const;

private:
    enum class Tone {
        Error,
        Warning,
        Info,
        Header
    };

    void status(Tone tone, const std::string& text) const;

    bool styled_;
};

} // namespace memomark
