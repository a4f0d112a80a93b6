#pragma once

/**
 * Image storage collaborator.
 *
 * Memos reference stored images as ![alt](image://<filename>). The store
 * turns filenames into bytes and bytes into filenames; both directions are
 * asynchronous and report failures through the returned future.
 */

#include <filesystem>
#include <future>
#include <string>

namespace memomark {

// Raw image file contents.
using ImageBytes = std::string;

/**
 * Abstract image storage.
 */
class ImageStore {
public:
    virtual ~ImageStore() = default;

    // Fetches the bytes of a stored image. The future throws when the image
    // cannot be read.
    virtual std::future<ImageBytes> get(const std::string& filename) = 0;

    // Stores bytes and returns the filename they are stored under.
    virtual std::future<std::string> save(const ImageBytes& bytes,
                                          const std::string& suggested_name) = 0;
};

/**
 * Image store backed by a local directory.
 *
 * Saved files are named by a content hash of their bytes plus the extension
 * of the suggested name, so saving the same image twice yields the same
 * filename. The directory is created on first save.
 */
class FileImageStore : public ImageStore {
public:
    explicit FileImageStore(std::filesystem::path directory);

    std::future<ImageBytes> get(const std::string& filename) override;
    std::future<std::string> save(const ImageBytes& bytes,
                                  const std::string& suggested_name) override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

// 64-bit FNV-1a of the bytes as 16 lowercase hex digits.
std::string content_hash(const ImageBytes& bytes);

// Storage filename for bytes: "<hash>.<ext>", ext taken from the suggested
// name (lowercased) or "png" when it has none.
std::string image_filename(const ImageBytes& bytes, const std::string& suggested_name);

// Markdown reference to a stored image: "![alt](image://filename)".
std::string image_markdown(const std::string& alt, const std::string& filename);

// Returns true for a bare filename: non-empty, no path separators, not "." or "..".
bool is_safe_filename(const std::string& filename);

// MIME type from the filename extension; application/octet-stream if unknown.
std::string image_mime_type(const std::string& filename);

} // namespace memomark
