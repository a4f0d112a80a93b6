#include "file_watcher.hpp"
#include "verbose.hpp"
#include <iostream>

namespace fs = std::filesystem;

namespace memomark {

FileWatcher::FileWatcher(std::string path, int debounce_ms, int poll_interval_ms)
    : path_(std::move(path))
    , poll_interval_ms_(poll_interval_ms)
{
    last_state_ = current_state();

#ifdef __linux__
    inotify_watcher_ = std::make_unique<InotifyWatcher>(debounce_ms);
    inotify_watcher_->on_change([this]() {
        check_now();
    });
#else
    (void)debounce_ms;
#endif
}

FileWatcher::~FileWatcher() {
    stop();
}

void FileWatcher::on_change(MemoChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_change_callback_ = std::move(callback);
}

void FileWatcher::use_polling() {
#ifdef __linux__
    use_inotify_ = false;
#endif
}

bool FileWatcher::is_event_based() const {
#ifdef __linux__
    return use_inotify_ && inotify_watcher_ && inotify_watcher_->is_running();
#else
    return false;
#endif
}

void FileWatcher::start() {
    if (running_.load()) {
        return;
    }

    stop_requested_.store(false);
    running_.store(true);

#ifdef __linux__
    if (use_inotify_ && inotify_watcher_ && inotify_watcher_->watch_file(path_)) {
        inotify_watcher_->start();
        verbose_log("Watch", "Started (inotify) on " + path_);
        return;
    }
    use_inotify_ = false;
#endif

    poll_thread_ = std::thread([this]() {
        poll_loop();
    });
    verbose_log("Watch", "Started (polling every " + std::to_string(poll_interval_ms_) +
                "ms) on " + path_);
}

void FileWatcher::stop() {
    if (!running_.load()) {
        return;
    }

    stop_requested_.store(true);

#ifdef __linux__
    if (inotify_watcher_ && inotify_watcher_->is_running()) {
        inotify_watcher_->stop();
    }
#endif

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    running_.store(false);
}

FileWatcher::FileState FileWatcher::current_state() const {
    FileState state;
    std::error_code ec;
    if (!fs::exists(path_, ec) || ec) {
        return state;
    }
    state.exists = true;

    auto mtime = fs::last_write_time(path_, ec);
    if (!ec) {
        state.mtime = mtime;
    }
    auto size = fs::file_size(path_, ec);
    if (!ec) {
        state.size = size;
    }
    return state;
}

void FileWatcher::poll_loop() {
    while (!stop_requested_.load()) {
        // Sleep in small increments to allow quick shutdown
        for (int waited = 0; waited < poll_interval_ms_ && !stop_requested_.load(); waited += 50) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        if (stop_requested_.load()) {
            break;
        }

        check_now();
    }
}

bool FileWatcher::check_now() {
    std::lock_guard<std::mutex> lock(callback_mutex_);

    FileState state = current_state();
    if (state == last_state_) {
        return false;
    }
    last_state_ = state;

    verbose_in("Watch", path_ + (state.exists ? " changed" : " removed"));

    if (on_change_callback_) {
        try {
            on_change_callback_();
        } catch (const std::exception& e) {
            std::cerr << "[FileWatcher] Callback error: " << e.what() << std::endl;
        }
    }
    return true;
}

} // namespace memomark
