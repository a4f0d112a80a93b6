#pragma once

/**
 * Memo file watcher for live re-rendering.
 *
 * Notices when the watched memo changes and invokes a callback. On Linux,
 * uses inotify for event-based watching. Falls back to polling the file's
 * modification time and size elsewhere, or when inotify is unavailable.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#ifdef __linux__
#include "inotify_watcher.hpp"
#endif

namespace memomark {

using MemoChangeCallback = std::function<void()>;

/**
 * Watches one memo file.
 *
 * Callbacks never run concurrently with each other; a slow re-render simply
 * delays the next one.
 */
class FileWatcher {
public:
    /**
     * Creates a file watcher.
     *
     * @param path File to watch
     * @param debounce_ms Quiet time after the last event before the callback (inotify)
     * @param poll_interval_ms How often to check for changes in polling mode
     */
    explicit FileWatcher(std::string path, int debounce_ms = 300, int poll_interval_ms = 500);

    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    void on_change(MemoChangeCallback callback);

    /**
     * Forces polling mode. Must be called before start().
     */
    void use_polling();

    /**
     * Starts watching in a background thread.
     * Does nothing if already running.
     */
    void start();

    /**
     * Stops watching.
     * Blocks until the background thread has stopped.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // True when events come from inotify rather than polling.
    bool is_event_based() const;

    /**
     * Compares the file's current state with the last one seen and runs the
     * callback if it differs. Returns true if a change was detected.
     */
    bool check_now();

private:
    struct FileState {
        bool exists = false;
        std::filesystem::file_time_type mtime{};
        std::uintmax_t size = 0;

        bool operator==(const FileState& other) const {
            return exists == other.exists && mtime == other.mtime && size == other.size;
        }
        bool operator!=(const FileState& other) const { return !(*this == other); }
    };

    FileState current_state() const;
    void poll_loop();

    std::string path_;
    int poll_interval_ms_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread poll_thread_;
    std::mutex callback_mutex_;  // Serializes callbacks and last_state_

    FileState last_state_;
    MemoChangeCallback on_change_callback_;

#ifdef __linux__
    std::unique_ptr<InotifyWatcher> inotify_watcher_;
    bool use_inotify_{true};
#endif
};

} // namespace memomark
