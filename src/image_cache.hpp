#pragma once

/**
 * Filename-keyed image cache shared across renders.
 *
 * The first lookup of an image:// reference starts one asynchronous fetch
 * from the image store and reports Loading; later lookups of the same
 * filename never fetch again and report the outcome once it is known.
 * cache:// references are served from memory only: put() registers bytes
 * under a key (pasted or attached images not yet persisted) and an unknown
 * key is Failed.
 *
 * Entries are append-only. Once resolved, a key keeps its bytes (or its
 * failure) for the lifetime of the cache.
 */

#include "image_store.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace memomark {

enum class ImageStatus {
    Loading,
    Ready,
    Failed
};

// Returns "loading", "ready" or "failed".
const char* to_string(ImageStatus status);

/**
 * Result of a cache lookup.
 */
struct ImageLookup {
    ImageStatus status = ImageStatus::Loading;
    std::shared_ptr<const ImageBytes> bytes;  // Set when Ready.
    std::string error;                        // Set when Failed.
};

/**
 * Splits "scheme://ref" into its parts. Returns false when there is no "://".
 */
bool split_image_url(const std::string& url, std::string& scheme, std::string& ref);

class ImageCache {
public:
    // Invoked on a worker thread after a fetch resolves, with the filename.
    using ResolvedCallback = std::function<void(const std::string& key)>;

    explicit ImageCache(std::shared_ptr<ImageStore> store);

    // Waits for outstanding fetches.
    ~ImageCache();

    ImageCache(const ImageCache&) = delete;
    ImageCache& operator=(const ImageCache&) = delete;

    /**
     * Looks up an image reference URL ("image://name" or "cache://key").
     * May start a fetch; never blocks on one.
     */
    ImageLookup lookup(const std::string& url);

    // Registers bytes under a key. An existing entry is left unchanged.
    void put(const std::string& key, ImageBytes bytes);

    // Sets the callback run when a fetch completes.
    void on_resolved(ResolvedCallback callback);

    // Blocks until no fetch is in flight and every worker has finished.
    void wait_idle();

    // Number of resolved entries.
    size_t size() const;

    // Number of fetches started so far.
    size_t fetch_count() const;

    // Worker threads not yet reaped.
    size_t worker_count() const;

private:
    struct Entry {
        ImageStatus status;
        std::shared_ptr<const ImageBytes> bytes;
        std::string error;
    };

    void start_fetch(const std::string& filename);
    void resolve(const std::string& filename, Entry entry);

    static ImageLookup to_lookup(const Entry& entry);

    std::shared_ptr<ImageStore> store_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<std::string, Entry> entries_;
    std::set<std::string> in_flight_;
    std::vector<std::future<void>> workers_;
    size_t fetch_count_ = 0;

    ResolvedCallback on_resolved_;
};

} // namespace memomark
