#include "image_cache.hpp"
#include "config.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace memomark {

const char* to_string(ImageStatus status) {
    switch (status) {
        case ImageStatus::Loading: return "loading";
        case ImageStatus::Ready:   return "ready";
        case ImageStatus::Failed:  return "failed";
    }
    return "unknown";
}

bool split_image_url(const std::string& url, std::string& scheme, std::string& ref) {
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        return false;
    }
    scheme = url.substr(0, sep);
    ref = url.substr(sep + 3);
    return true;
}

ImageCache::ImageCache(std::shared_ptr<ImageStore> store)
    : store_(std::move(store)) {}

ImageCache::~ImageCache() {
    wait_idle();
}

ImageLookup ImageCache::to_lookup(const Entry& entry) {
    ImageLookup result;
    result.status = entry.status;
    result.bytes = entry.bytes;
    result.error = entry.error;
    return result;
}

ImageLookup ImageCache::lookup(const std::string& url) {
    std::string scheme;
    std::string ref;
    if (!split_image_url(url, scheme, ref) || ref.empty()) {
        return {ImageStatus::Failed, nullptr, "Malformed image reference: " + url};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(ref);
    if (it != entries_.end()) {
        return to_lookup(it->second);
    }

    if (scheme == CACHE_SCHEME) {
        return {ImageStatus::Failed, nullptr, "Not in cache: " + ref};
    }
    if (scheme != IMAGE_SCHEME) {
        return {ImageStatus::Failed, nullptr, "Unsupported image scheme: " + scheme};
    }

    if (in_flight_.count(ref) == 0) {
        if (!store_) {
            return {ImageStatus::Failed, nullptr, "No image store"};
        }
        start_fetch(ref);
    }
    return {ImageStatus::Loading, nullptr, ""};
}

// Called with mutex_ held.
void ImageCache::start_fetch(const std::string& filename) {
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(),
        [](const std::future<void>& worker) {
            return worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), workers_.end());

    in_flight_.insert(filename);
    fetch_count_++;
    verbose_out("Images", "Fetching " + filename);

    workers_.push_back(std::async(std::launch::async, [this, filename]() {
        Entry entry{ImageStatus::Failed, nullptr, ""};
        try {
            ImageBytes bytes = store_->get(filename).get();
            entry.status = ImageStatus::Ready;
            entry.bytes = std::make_shared<const ImageBytes>(std::move(bytes));
            verbose_in("Images", filename + " (" + std::to_string(entry.bytes->size()) + " bytes)");
        } catch (const std::exception& e) {
            entry.error = e.what();
            verbose_err("Images", filename + ": " + entry.error);
        }
        resolve(filename, std::move(entry));
    }));
}

void ImageCache::resolve(const std::string& filename, Entry entry) {
    // Clears the in-flight mark however the callback exits.
    struct FetchDone {
        ImageCache& cache;
        const std::string& filename;

        ~FetchDone() {
            {
                std::lock_guard<std::mutex> lock(cache.mutex_);
                cache.in_flight_.erase(filename);
            }
            cache.idle_cv_.notify_all();
        }
    } done{*this, filename};

    ResolvedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace(filename, std::move(entry));
        callback = on_resolved_;
    }

    // Outside the lock: the callback usually re-renders, which looks up again.
    if (callback) {
        try {
            callback(filename);
        } catch (const std::exception& e) {
            verbose_err("Images", std::string("Resolve callback failed: ") + e.what());
        }
    }
}

void ImageCache::put(const std::string& key, ImageBytes bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry{ImageStatus::Ready, std::make_shared<const ImageBytes>(std::move(bytes)), ""};
    entries_.emplace(key, std::move(entry));
}

void ImageCache::on_resolved(ResolvedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_resolved_ = std::move(callback);
}

void ImageCache::wait_idle() {
    std::vector<std::future<void>> workers;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this]() { return in_flight_.empty(); });
        workers.swap(workers_);
    }

    // A worker may still be unwinding after its in-flight mark is cleared.
    for (auto& worker : workers) {
        worker.wait();
    }
}

size_t ImageCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ImageCache::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

size_t ImageCache::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

} // namespace memomark
