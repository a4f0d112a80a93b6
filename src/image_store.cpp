#include "image_store.hpp"
#include "config.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

namespace memomark {

namespace {
    std::string lowercase(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string extension_of(const std::string& filename) {
        auto dot_pos = filename.rfind('.');
        if (dot_pos == std::string::npos || dot_pos + 1 >= filename.length()) {
            return "";
        }
        return lowercase(filename.substr(dot_pos + 1));
    }

    ImageBytes read_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Image not found: " + path.filename().string());
        }
        return ImageBytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
}

FileImageStore::FileImageStore(fs::path directory)
    : directory_(std::move(directory)) {}

std::future<ImageBytes> FileImageStore::get(const std::string& filename) {
    fs::path dir = directory_;
    return std::async(std::launch::async, [dir, filename]() {
        if (!is_safe_filename(filename)) {
            throw std::runtime_error("Invalid image filename: " + filename);
        }
        verbose_log("Images", "Reading " + (dir / filename).string());
        return read_file(dir / filename);
    });
}

std::future<std::string> FileImageStore::save(const ImageBytes& bytes,
                                              const std::string& suggested_name) {
    fs::path dir = directory_;
    return std::async(std::launch::async, [dir, bytes, suggested_name]() {
        std::string filename = image_filename(bytes, suggested_name);
        fs::path path = dir / filename;

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("Cannot create " + dir.string() + ": " + ec.message());
        }

        if (fs::exists(path)) {
            verbose_log("Images", "Already stored: " + filename);
            return filename;
        }

        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot write " + path.string());
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            throw std::runtime_error("Failed writing " + path.string());
        }

        verbose_log("Images", "Stored " + std::to_string(bytes.size()) + " bytes as " + filename);
        return filename;
    });
}

std::string content_hash(const ImageBytes& bytes) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : bytes) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }

    static const char* digits = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; i--) {
        out[i] = digits[hash & 0xf];
        hash >>= 4;
    }
    return out;
}

std::string image_filename(const ImageBytes& bytes, const std::string& suggested_name) {
    std::string ext = extension_of(fs::path(suggested_name).filename().string());
    if (ext.empty()) {
        ext = DEFAULT_IMAGE_EXTENSION;
    }
    return content_hash(bytes) + "." + ext;
}

std::string image_markdown(const std::string& alt, const std::string& filename) {
    return "![" + alt + "](" + IMAGE_SCHEME + "://" + filename + ")";
}

bool is_safe_filename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    return filename.find('/') == std::string::npos && filename.find('\\') == std::string::npos;
}

std::string image_mime_type(const std::string& filename) {
    std::string ext = extension_of(filename);

    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "webp") return "image/webp";
    if (ext == "bmp") return "image/bmp";
    if (ext == "svg") return "image/svg+xml";
    if (ext == "ico") return "image/x-icon";

    return "application/octet-stream";
}

} // namespace memomark
