#include "console.hpp"
#include "terminal.hpp"
#include <iostream>
#include <unistd.h>

namespace memomark {

Console::Console()
    : styled_(terminal::supports_color() && isatty(STDERR_FILENO) != 0) {}

void Console::print(const std::string& text) const {
    std::cout << text;
}

void Console::println(const std::string& text) const {
    std::cout << text << '\n';
}

void Console::flush() const {
    std::cout.flush();
}

void Console::status(Tone tone, const std::string& text) const {
    if (!styled_) {
        std::cerr << text << std::endl;
        return;
    }
    const char* escape = "\033[36m";
    switch (tone) {
        case Tone::Error:   escape = "\033[31m"; break;
        case Tone::Warning: escape = "\033[33m"; break;
        case Tone::Header:  escape = "\033[1;36m"; break;
        case Tone::Info:    break;
    }
    std::cerr << escape << text << "\033[0m" << std::endl;
}

void Console::print_error(const std::string& text) const {
    status(Tone::Error, text);
}

void Console::print_warning(const std::string& text) const {
    status(Tone::Warning, text);
}

void Console::print_info(const std::string& text) const {
    status(Tone::Info, text);
}

void Console::print_header(const std::string& text) const {
    status(Tone::Header, text);
}

} // namespace memomark
