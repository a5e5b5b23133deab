#pragma once

#include <coroutine>
#include <exception>
#include <memory>
#include <utility>

namespace NOdin {

struct TVoidPromise;

/// Fire-and-forget coroutine: starts eagerly, frees itself on completion.
/// Exceptions must be handled inside the body.
struct TVoidTask : std::coroutine_handle<TVoidPromise>
{
    using promise_type = TVoidPromise;
};

struct TVoidPromise
{
    TVoidTask get_return_object() { return { TVoidTask::from_promise(*this) }; }
    std::suspend_never initial_suspend() { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void return_void() {}
    void unhandled_exception() { std::terminate(); }
};

/**
 * @brief Slot where a coroutine parks until somebody fires it.
 *
 * A slot fires at most once. Several wakers (reply, timeout, free space)
 * can race for the same slot; the first Fire() wins and the others are
 * no-ops. If the parked coroutine is destroyed first, its TParkAwaiter
 * clears the handle so a late Fire() does not touch a dead frame.
 *
 * Slots are loop-thread objects: Fire() and the awaiter must run on the
 * thread that drives the poller.
 */
struct TParked {
    std::coroutine_handle<> Handle;
    bool Fired = false;

    /// Marks the slot fired and resumes the parked coroutine, if any.
    /// Returns false if the slot had already fired.
    bool Fire() {
        if (Fired) {
            return false;
        }
        Fired = true;
        if (auto h = std::exchange(Handle, nullptr)) {
            h.resume();
        }
        return true;
    }
};

struct TParkAwaiter {
    explicit TParkAwaiter(std::shared_ptr<TParked> slot)
        : Slot(std::move(slot))
    { }

    TParkAwaiter(TParkAwaiter&&) = default;
    TParkAwaiter(const TParkAwaiter&) = delete;

    ~TParkAwaiter() {
        if (Slot) {
            Slot->Handle = nullptr;
        }
    }

    bool await_ready() const {
        return Slot->Fired;
    }

    void await_suspend(std::coroutine_handle<> h) {
        Slot->Handle = h;
    }

    void await_resume() {
        Slot->Handle = nullptr;
    }

    std::shared_ptr<TParked> Slot;
};

} // namespace NOdin
