#ifdef __linux__

#include "inotify_watcher.hpp"
#include "verbose.hpp"
#include <fcntl.h>
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace memomark {

namespace {
    // Anything that can leave the memo with new content, or remove it.
    constexpr uint32_t MEMO_EVENTS =
        IN_CLOSE_WRITE | IN_MODIFY | IN_CREATE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM;

    constexpr long PENDING_TICK_US = 50000;
    constexpr long IDLE_TICK_S = 60;

    void report(const std::string& what) {
        std::cerr << "[InotifyWatcher] " << what << ": " << std::strerror(errno) << std::endl;
    }

    void close_fd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

InotifyWatcher::InotifyWatcher(int debounce_ms)
    : debounce_(debounce_ms)
{
    notify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (notify_fd_ < 0) {
        report("inotify_init1");
        return;
    }
    if (pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) < 0) {
        report("pipe2");
        close_fd(notify_fd_);
    }
}

InotifyWatcher::~InotifyWatcher() {
    stop();
    close_fd(notify_fd_);
    close_fd(wake_pipe_[0]);
    close_fd(wake_pipe_[1]);
}

void InotifyWatcher::on_change(FileChangeCallback callback) {
    callback_ = std::move(callback);
}

bool InotifyWatcher::watch_file(const std::string& path) {
    if (notify_fd_ < 0) {
        return false;
    }

    fs::path memo = fs::absolute(path);
    std::string dir = memo.parent_path().string();

    if (dir_watch_ >= 0) {
        inotify_rm_watch(notify_fd_, dir_watch_);
        dir_watch_ = -1;
    }

    dir_watch_ = inotify_add_watch(notify_fd_, dir.c_str(), MEMO_EVENTS);
    if (dir_watch_ < 0) {
        report("inotify_add_watch " + dir);
        return false;
    }

    memo_name_ = memo.filename().string();
    verbose_log("Watch", "inotify on " + dir + " for " + memo_name_);
    return true;
}

void InotifyWatcher::start() {
    if (running_.load() || dir_watch_ < 0) {
        return;
    }
    stop_requested_.store(false);
    quiet_since_.reset();
    running_.store(true);
    thread_ = std::thread(&InotifyWatcher::run, this);
}

void InotifyWatcher::stop() {
    if (!running_.load()) {
        return;
    }
    stop_requested_.store(true);

    char byte = 0;
    if (write(wake_pipe_[1], &byte, 1) < 0) {
        report("wake write");
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    // Drop the wake byte so a later start() does not exit at once
    char sink;
    while (read(wake_pipe_[0], &sink, 1) > 0) {}
    running_.store(false);
}

InotifyWatcher::Wake InotifyWatcher::wait_for_events(bool pending) const {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(notify_fd_, &fds);
    FD_SET(wake_pipe_[0], &fds);

    timeval tick{};
    if (pending) {
        tick.tv_usec = PENDING_TICK_US;
    } else {
        tick.tv_sec = IDLE_TICK_S;
    }

    int ready = select(std::max(notify_fd_, wake_pipe_[0]) + 1, &fds, nullptr, nullptr, &tick);
    if (ready < 0) {
        return errno == EINTR ? Wake::Timeout : Wake::Error;
    }
    if (ready == 0) {
        return Wake::Timeout;
    }
    if (FD_ISSET(wake_pipe_[0], &fds)) {
        return Wake::Shutdown;
    }
    return Wake::Events;
}

// Reads every queued event. Returns true if one of them names the memo.
bool InotifyWatcher::drain_events() {
    alignas(inotify_event) char buffer[4096];
    bool touched = false;

    for (;;) {
        ssize_t len = read(notify_fd_, buffer, sizeof(buffer));
        if (len <= 0) {
            if (len < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                report("read");
            }
            return touched;
        }

        for (ssize_t off = 0; off < len;) {
            const auto* event = reinterpret_cast<const inotify_event*>(buffer + off);
            if (event->len > 0 && memo_name_ == event->name) {
                touched = true;
            }
            off += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
        }
    }
}

void InotifyWatcher::notify() {
    if (!callback_) {
        return;
    }
    try {
        callback_();
    } catch (const std::exception& e) {
        std::cerr << "[InotifyWatcher] Callback error: " << e.what() << std::endl;
    }
}

void InotifyWatcher::run() {
    while (!stop_requested_.load()) {
        Wake wake = wait_for_events(quiet_since_.has_value());
        if (wake == Wake::Shutdown || stop_requested_.load()) {
            break;
        }
        if (wake == Wake::Error) {
            report("select");
            break;
        }

        if (wake == Wake::Events && drain_events()) {
            quiet_since_ = Clock::now();
        }

        if (quiet_since_ && Clock::now() - *quiet_since_ >= debounce_) {
            quiet_since_.reset();
            notify();
        }
    }
}

} // namespace memomark

#endif // __linux__
