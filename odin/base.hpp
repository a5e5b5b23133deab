#pragma once

#include <algorithm>
#include <chrono>
#include <coroutine>
#include <tuple>

#include <time.h>

namespace NOdin {

using TClock = std::chrono::steady_clock;
using TTime = TClock::time_point;
using THandle = std::coroutine_handle<>;

/// Timer heap entry. std::priority_queue pops the earliest deadline first;
/// equal deadlines come out in insertion (id) order, and a cancellation
/// marker (empty handle) comes out right before the timer it cancels.
struct TTimer {
    TTime Deadline;
    unsigned Id;
    THandle Handle;

    bool operator<(const TTimer& other) const {
        return std::tuple(Deadline, Id, static_cast<bool>(Handle))
            > std::tuple(other.Deadline, other.Id, static_cast<bool>(other.Handle));
    }
};

/// One readiness request (or, with an empty handle, a withdrawal).
struct TEvent {
    enum : int {
        READ = 1,
        WRITE = 2,
    };

    int Fd;
    int Type;
    THandle Handle;

    bool Match(const TEvent& other) const {
        return Fd == other.Fd && (Type & other.Type);
    }
};

/// Coroutines waiting on one descriptor, at most one per direction.
struct TInterest {
    THandle Read;
    THandle Write;

    int Mask() const {
        return (Read ? TEvent::READ : 0) | (Write ? TEvent::WRITE : 0);
    }

    // Applies a change, returns true if the wanted mask moved.
    bool Apply(const TEvent& change) {
        int before = Mask();
        if (change.Type & TEvent::READ) {
            Read = change.Handle;
        }
        if (change.Type & TEvent::WRITE) {
            Write = change.Handle;
        }
        return before != Mask();
    }
};

inline timespec ToTimespec(std::chrono::nanoseconds duration) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    timespec ts;
    ts.tv_sec = seconds.count();
    ts.tv_nsec = (duration - seconds).count();
    return ts;
}

/// Time left until @p deadline, zero if it has passed, capped at @p maxDuration.
inline timespec GetTimespec(TTime now, TTime deadline, std::chrono::milliseconds maxDuration) {
    if (deadline <= now) {
        return timespec{0, 0};
    }
    std::chrono::nanoseconds left = deadline - now;
    return ToTimespec(std::min<std::chrono::nanoseconds>(left, maxDuration));
}

} // namespace NOdin
