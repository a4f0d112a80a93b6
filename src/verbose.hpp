#pragma once

/**
 * Diagnostic trace for -v/--verbose.
 *
 * Lines go to stderr as "[HH:MM:SS.mmm] [Tag] message". Image workers and
 * the watcher thread log concurrently, so writes are serialized.
 */

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace memomark {

namespace trace {
    inline std::atomic<bool> enabled{false};
    inline std::mutex write_mutex;

    enum class Direction {
        Note,
        Out,
        In,
        Fault
    };

    inline std::string clock_stamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t secs = system_clock::to_time_t(now);
        long millis = static_cast<long>(
            duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

        std::tm local{};
        localtime_r(&secs, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis;
        return out.str();
    }

    inline void emit(Direction dir, const std::string& tag, const std::string& message) {
        if (!enabled.load(std::memory_order_relaxed)) {
            return;
        }

        const char* color = "\033[36m";
        const char* arrow = "";
        switch (dir) {
            case Direction::Note:  break;
            case Direction::Out:   color = "\033[33m"; arrow = " >>>"; break;
            case Direction::In:    color = "\033[32m"; arrow = " <<<"; break;
            case Direction::Fault: color = "\033[31m"; arrow = " ERR"; break;
        }

        std::lock_guard<std::mutex> lock(write_mutex);
        std::cerr << "\033[90m[" << clock_stamp() << "]\033[0m " << color << '[' << tag
                  << arrow << "]\033[0m " << message << std::endl;
    }
}

inline void set_verbose(bool on) {
    trace::enabled.store(on);
}

inline void verbose_log(const std::string& tag, const std::string& message) {
    trace::emit(trace::Direction::Note, tag, message);
}

// Work handed off: a fetch started, a response about to go out.
inline void verbose_out(const std::string& tag, const std::string& message) {
    trace::emit(trace::Direction::Out, tag, message);
}

// Work coming back: a fetch finished, a request arrived.
inline void verbose_in(const std::string& tag, const std::string& message) {
    trace::emit(trace::Direction::In, tag, message);
}

// Detail for failures. Anything the user must see is reported elsewhere too.
inline void verbose_err(const std::string& tag, const std::string& message) {
    trace::emit(trace::Direction::Fault, tag, message);
}

} // namespace memomark
