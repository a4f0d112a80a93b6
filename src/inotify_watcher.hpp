#pragma once

/**
 * inotify backend for watching a single memo file (Linux only).
 *
 * Editors rarely write a file in place: many save to a temporary name and
 * rename it over the memo. The watch is therefore placed on the memo's
 * directory, and only events naming the memo are kept. Bursts of events are
 * coalesced: the callback runs once the memo has been quiet for the debounce
 * interval.
 */

#ifdef __linux__

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace memomark {

using FileChangeCallback = std::function<void()>;

class InotifyWatcher {
public:
    explicit InotifyWatcher(int debounce_ms = 300);
    ~InotifyWatcher();

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    void on_change(FileChangeCallback callback);

    // Points the watch at path's directory, dropping any earlier watch.
    // Returns false when inotify is unavailable or the directory cannot be watched.
    bool watch_file(const std::string& path);

    // Starts the event thread. No-op when running or when nothing is watched.
    void start();

    // Wakes and joins the event thread.
    void stop();

    bool is_running() const { return running_.load(); }

private:
    enum class Wake {
        Timeout,
        Events,
        Shutdown,
        Error
    };

    using Clock = std::chrono::steady_clock;

    Wake wait_for_events(bool pending) const;
    bool drain_events();
    void run();
    void notify();

    int notify_fd_{-1};
    int wake_pipe_[2]{-1, -1};
    int dir_watch_{-1};
    std::string memo_name_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread thread_;

    std::optional<Clock::time_point> quiet_since_;  // Set while a change is pending
    FileChangeCallback callback_;
    std::chrono::milliseconds debounce_;
};

} // namespace memomark

#endif // __linux__
