#pragma once

/**
 * @file corochain.hpp
 * @brief Eager coroutine futures.
 *
 * A TFuture<T> owns the frame of a coroutine that starts running as soon as
 * it is called. The frame stays alive after the body finishes and keeps the
 * outcome: the returned value or the exception that escaped. Awaiting a
 * finished future does not suspend; awaiting a running one makes the caller
 * its continuation, resumed from final_suspend.
 *
 * Dropping a future destroys the frame, running or not. That is how actors,
 * connection readers and timers are cancelled.
 *
 * @code
 * TFuture<int> Answer() {
 *     co_return 42;
 * }
 *
 * TFuture<void> Caller() {
 *     int v = co_await Answer();
 *     co_return;
 * }
 * @endcode
 */

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

#include "promises.hpp"

namespace NOdin {

template<typename T> class TFuture;
template<typename T> struct TPromise;

namespace NDetail {

struct TUnit { };

template<typename T>
using TStored = std::conditional_t<std::is_void_v<T>, TUnit, T>;

template<typename T>
struct TPromiseCore {
    std::suspend_never initial_suspend() noexcept { return {}; }

    auto final_suspend() noexcept {
        struct TResumeContinuation {
            bool await_ready() noexcept { return false; }
            std::coroutine_handle<> await_suspend(std::coroutine_handle<TPromise<T>> h) noexcept {
                return h.promise().Continuation;
            }
            void await_resume() noexcept { }
        };
        return TResumeContinuation{};
    }

    void unhandled_exception() {
        Outcome.template emplace<2>(std::current_exception());
    }

    bool Ready() const {
        return Outcome.index() != 0;
    }

    // Rethrows the escaped exception. Called once, from await_resume().
    TStored<T> Take() {
        if (auto* error = std::get_if<2>(&Outcome)) {
            std::rethrow_exception(*error);
        }
        return std::move(std::get<1>(Outcome));
    }

    std::coroutine_handle<> Continuation = std::noop_coroutine();
    std::variant<std::monostate, TStored<T>, std::exception_ptr> Outcome;
};

} // namespace NDetail

template<typename T>
struct TPromise: public NDetail::TPromiseCore<T> {
    TFuture<T> get_return_object();

    template<typename U = T>
    void return_value(U&& value) {
        this->Outcome.template emplace<1>(std::forward<U>(value));
    }
};

template<>
struct TPromise<void>: public NDetail::TPromiseCore<void> {
    TFuture<void> get_return_object();

    void return_void() {
        Outcome.emplace<1>();
    }
};

template<typename T>
class TFuture {
public:
    using promise_type = TPromise<T>;

    TFuture() = default;

    explicit TFuture(std::coroutine_handle<promise_type> coro)
        : Coro_(coro)
    { }

    TFuture(TFuture&& other) noexcept
        : Coro_(std::exchange(other.Coro_, nullptr))
    { }

    TFuture& operator=(TFuture&& other) noexcept {
        if (this != &other) {
            Reset();
            Coro_ = std::exchange(other.Coro_, nullptr);
        }
        return *this;
    }

    TFuture(const TFuture&) = delete;
    TFuture& operator=(const TFuture&) = delete;

    ~TFuture() {
        Reset();
    }

    bool await_ready() const {
        return Coro_.promise().Ready();
    }

    void await_suspend(std::coroutine_handle<> caller) {
        Coro_.promise().Continuation = caller;
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            Coro_.promise().Take();
        } else {
            return Coro_.promise().Take();
        }
    }

    /// True once the body has run to completion (value or exception).
    bool done() const {
        return Coro_.done();
    }

    /// Frame handle, or null for a default-constructed future.
    std::coroutine_handle<> raw() const {
        return Coro_;
    }

private:
    void Reset() {
        if (Coro_) {
            std::exchange(Coro_, nullptr).destroy();
        }
    }

    std::coroutine_handle<promise_type> Coro_ = nullptr;
};

template<typename T>
TFuture<T> TPromise<T>::get_return_object() {
    return TFuture<T>{std::coroutine_handle<TPromise<T>>::from_promise(*this)};
}

inline TFuture<void> TPromise<void>::get_return_object() {
    return TFuture<void>{std::coroutine_handle<TPromise<void>>::from_promise(*this)};
}

} // namespace NOdin
