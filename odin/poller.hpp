#pragma once

#include <chrono>
#include <vector>
#include <queue>
#include <algorithm>
#include <utility>

#include "base.hpp"

#ifdef Yield
#undef Yield
#endif

namespace NOdin {

class TPollerBase;

/// Awaiter returned by TPollerBase::Sleep(). Cancels its timer if the
/// sleeping coroutine is destroyed before the deadline.
class TSleepAwaiter {
public:
    TSleepAwaiter(TPollerBase* poller, TTime deadline)
        : Poller_(poller)
        , Deadline_(deadline)
    { }

    TSleepAwaiter(TSleepAwaiter&& other)
        : Poller_(std::exchange(other.Poller_, nullptr))
        , Deadline_(other.Deadline_)
        , TimerId_(other.TimerId_)
        , Armed_(std::exchange(other.Armed_, false))
    { }

    TSleepAwaiter(const TSleepAwaiter&) = delete;
    TSleepAwaiter& operator=(const TSleepAwaiter&) = delete;

    ~TSleepAwaiter();

    bool await_ready() const {
        return false;
    }

    void await_suspend(THandle h);

    void await_resume() {
        Poller_ = nullptr;
    }

private:
    TPollerBase* Poller_;
    TTime Deadline_;
    unsigned TimerId_ = 0;
    bool Armed_ = false;
};

/**
 * @class TPollerBase
 * @brief What the epoll and poll backends share: the timer heap, the list of
 * descriptor changes made since the last Poll() and the events that Poll()
 * found ready.
 *
 * A backend's Poll() pushes Changes_ to the kernel, waits at most until the
 * nearest timer, fills ReadyEvents_ and fires due timers. The loop then
 * calls WakeupReadyHandles().
 *
 * Loop-thread only. Other threads reach the loop through the actor system
 * wakeup descriptor.
 */
class TPollerBase {
public:
    TPollerBase() = default;

    TPollerBase(const TPollerBase& ) = delete;
    TPollerBase& operator=(const TPollerBase& ) = delete;

    /// Resumes @p h at @p deadline. A default TTime{} means the next round.
    unsigned AddTimer(TTime deadline, THandle h) {
        unsigned id = NextTimerId_++;
        Timers_.push(TTimer{deadline, id, h});
        return id;
    }

    /**
     * @brief Cancels a timer.
     *
     * Pushes an empty marker with the same deadline and id; the heap
     * order puts it in front of the live entry and ProcessTimers() drops
     * both.
     *
     * @return true if the timer has already fired.
     */
    bool RemoveTimer(unsigned timerId, TTime deadline) {
        if (timerId == LastFiredTimer_) {
            return true;
        }
        Timers_.push(TTimer{deadline, timerId, {}});
        return false;
    }

    void AddRead(int fd, THandle h) {
        Change(TEvent{fd, TEvent::READ, h});
    }

    void AddWrite(int fd, THandle h) {
        Change(TEvent{fd, TEvent::WRITE, h});
    }

    /// Withdraws both directions of @p fd. Called on close.
    void RemoveEvent(int fd) {
        Change(TEvent{fd, TEvent::READ | TEvent::WRITE, {}});
    }

    TSleepAwaiter Sleep(TTime until) {
        return TSleepAwaiter{this, until};
    }

    template<typename Rep, typename Period>
    TSleepAwaiter Sleep(std::chrono::duration<Rep,Period> duration) {
        return Sleep(TClock::now() + duration);
    }

    /// Suspends until the next loop round.
    TSleepAwaiter Yield() {
        return Sleep(TTime{});
    }

    /**
     * @brief Resumes the coroutine behind a ready event.
     *
     * A descriptor is one-shot: unless the resumed code waits on the same
     * fd and direction again before returning, the interest is withdrawn.
     * The resumed code may start other coroutines, so the search covers
     * every change appended since the call.
     */
    void Wakeup(TEvent&& ready) {
        auto first = Changes_.size();
        ready.Handle.resume();
        bool rearmed = std::any_of(Changes_.begin() + first, Changes_.end(), [&](const TEvent& ch) {
            return ch.Match(ready);
        });
        if (!rearmed) {
            Changes_.push_back(TEvent{ready.Fd, ready.Type, {}});
        }
    }

    void WakeupReadyHandles() {
        for (auto&& ev : ReadyEvents_) {
            Wakeup(std::move(ev));
        }
    }

protected:
    void Change(TEvent&& change) {
        MaxFd_ = std::max(MaxFd_, change.Fd);
        Changes_.push_back(std::move(change));
    }

    timespec GetTimeout() const {
        if (Timers_.empty()) {
            return ToTimespec(MaxDuration_);
        }
        TTime deadline = Timers_.top().Deadline;
        if (deadline == TTime{}) {
            return timespec{0, 0};
        }
        return GetTimespec(TClock::now(), deadline, MaxDuration_);
    }

    void Reset() {
        ReadyEvents_.clear();
        Changes_.clear();
        MaxFd_ = 0;
    }

    void ProcessTimers() {
        auto now = TClock::now();
        bool cancelled = false;
        unsigned cancelledId = 0;

        while (!Timers_.empty() && Timers_.top().Deadline <= now) {
            TTimer timer = Timers_.top();
            Timers_.pop();

            if (!timer.Handle) {
                cancelled = true;
                cancelledId = timer.Id;
                continue;
            }
            if (cancelled && cancelledId == timer.Id) {
                cancelled = false;
                continue;
            }
            LastFiredTimer_ = timer.Id;
            timer.Handle.resume();
        }
    }

    int MaxFd_ = -1;
    std::vector<TEvent> Changes_;
    std::vector<TEvent> ReadyEvents_;
    std::priority_queue<TTimer> Timers_;
    unsigned NextTimerId_ = 0;
    unsigned LastFiredTimer_ = static_cast<unsigned>(-1);
    std::chrono::milliseconds MaxDuration_{100};
};

inline TSleepAwaiter::~TSleepAwaiter() {
    if (Poller_ && Armed_) {
        Poller_->RemoveTimer(TimerId_, Deadline_);
    }
}

inline void TSleepAwaiter::await_suspend(THandle h) {
    TimerId_ = Poller_->AddTimer(Deadline_, h);
    Armed_ = true;
}

} // namespace NOdin
