#include "memo_file.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace memomark {

std::string read_memo(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open memo: " + path);
    }
    std::string text = read_memo(file);
    if (file.bad()) {
        throw std::runtime_error("Failed reading memo: " + path);
    }
    return text;
}

std::string read_memo(std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace memomark
