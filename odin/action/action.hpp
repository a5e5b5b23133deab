#pragma once

/**
 * @file action.hpp
 * @brief Callbacks that let a publisher notify subscribers it knows nothing about.
 *
 * An action is created where the application is assembled (in main() or a
 * test) and handed to its owner, which executes it whenever its state
 * changes. Subscriber failures come back as ActionError so the owner only
 * deals with one error kind.
 *
 * @code{.cpp}
 * TActionList<TTrack> onUpdate;
 * onUpdate.Add(SendMsgAction(server, [](const TTrack& t) {
 *     return TBroadcastWsMsg{"tracks", "update", ToJson(t)};
 * }));
 * co_await onUpdate.Execute(track);
 * @endcode
 */

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <odin/corochain.hpp>
#include <odin/errors.hpp>
#include <odin/log.hpp>
#include <odin/actors/handle.hpp>

namespace NOdin {
namespace NAction {

/// Wraps @p error into ActionError, keeping its kind in the message.
inline TError MapActionError(const TError& error) {
    if (error.Kind == EErrorKind::ActionError) {
        return error;
    }
    return TError{EErrorKind::ActionError, error.ToString()};
}

inline TError MapActionError(EErrorKind kind, const std::string& message) {
    return MapActionError(TError{kind, message});
}

inline std::unexpected<TError> ActionError(std::string message) {
    return MakeError(EErrorKind::ActionError, std::move(message));
}

namespace NDetail {

template<typename T>
struct TIsFuture: std::false_type { };

template<typename T>
struct TIsFuture<TFuture<T>>: std::true_type { };

// Converts whatever a subscriber callable returned into TResult<void>.
template<typename R>
TResult<void> ToActionResult(R&& r) {
    using TRet = std::decay_t<R>;
    if constexpr (std::is_same_v<TRet, bool>) {
        if (!r) {
            return ActionError("action returned false");
        }
        return {};
    } else {
        static_assert(std::is_same_v<TRet, TResult<void>>, "action must return void, bool, TResult<void> or a future of these");
        if (!r) {
            return std::unexpected(MapActionError(r.error()));
        }
        return {};
    }
}

template<typename F, typename... TArgs>
TFuture<TResult<void>> Invoke(const F& f, const TArgs&... args) {
    using R = std::invoke_result_t<const F&, const TArgs&...>;
    try {
        if constexpr (std::is_void_v<R>) {
            f(args...);
            co_return TResult<void>{};
        } else if constexpr (std::is_same_v<R, TFuture<void>>) {
            co_await f(args...);
            co_return TResult<void>{};
        } else if constexpr (TIsFuture<R>::value) {
            co_return ToActionResult(co_await f(args...));
        } else {
            co_return ToActionResult(f(args...));
        }
    } catch (const std::exception& ex) {
        co_return ActionError(ex.what());
    }
}

} // namespace NDetail

/**
 * @class TAction
 * @brief One subscriber callback taking the publisher's data by reference.
 *
 * The callable may return void, bool, TResult<void> or a TFuture of void or
 * TResult<void>. Errors and exceptions are mapped to ActionError. An empty
 * action succeeds without doing anything.
 *
 * The data reference must stay valid until the returned future completes.
 */
template<typename T>
class TAction {
public:
    using TFunc = std::function<TFuture<TResult<void>>(const T&)>;

    TAction() = default;

    template<typename F>
        requires (!std::is_same_v<std::decay_t<F>, TAction>)
    TAction(F f, std::string name = "action")
        : Func_([f = std::move(f)](const T& data) { return NDetail::Invoke(f, data); })
        , Name_(std::move(name))
    { }

    bool IsEmpty() const {
        return !Func_;
    }

    const std::string& Name() const {
        return Name_;
    }

    TFuture<TResult<void>> Execute(const T& data) const {
        if (!Func_) {
            co_return TResult<void>{};
        }
        auto func = Func_;
        co_return co_await func(data);
    }

private:
    TFunc Func_;
    std::string Name_;
};

/// Two-argument flavour, for owners passing their state plus request data.
template<typename A, typename B>
class TBiAction {
public:
    using TFunc = std::function<TFuture<TResult<void>>(const A&, const B&)>;

    TBiAction() = default;

    template<typename F>
        requires (!std::is_same_v<std::decay_t<F>, TBiAction>)
    TBiAction(F f)
        : Func_([f = std::move(f)](const A& a, const B& b) { return NDetail::Invoke(f, a, b); })
    { }

    bool IsEmpty() const {
        return !Func_;
    }

    TFuture<TResult<void>> Execute(const A& a, const B& b) const {
        if (!Func_) {
            co_return TResult<void>{};
        }
        auto func = Func_;
        co_return co_await func(a, b);
    }

private:
    TFunc Func_;
};

/**
 * @class IDynAction
 * @brief Boxed action, used where subscribers are only known at run time
 * and actions travel inside messages.
 */
template<typename T>
class IDynAction {
public:
    virtual ~IDynAction() = default;
    virtual TFuture<TResult<void>> Execute(const T& data) = 0;
};

template<typename T>
using TDynAction = std::shared_ptr<IDynAction<T>>;

template<typename T>
class TDynActionAdapter: public IDynAction<T> {
public:
    explicit TDynActionAdapter(TAction<T> action)
        : Action_(std::move(action))
    { }

    TFuture<TResult<void>> Execute(const T& data) override {
        return Action_.Execute(data);
    }

private:
    TAction<T> Action_;
};

template<typename T, typename F>
TDynAction<T> MakeDynAction(F f) {
    return std::make_shared<TDynActionAdapter<T>>(TAction<T>(std::move(f)));
}

enum class EActionPolicy {
    // run every action, report "<n> of <m> actions failed"
    CollectAll,
    // stop at the first failure
    FailFast,
    // run every action, always succeed
    Ignore,
};

/**
 * @class TActionList
 * @brief Ordered set of actions executed one after another.
 */
template<typename T>
class TActionList {
public:
    explicit TActionList(EActionPolicy policy = EActionPolicy::CollectAll)
        : Policy_(policy)
    { }

    void Add(TAction<T> action) {
        if (!action.IsEmpty()) {
            Actions_.emplace_back(std::move(action));
        }
    }

    size_t Size() const {
        return Actions_.size();
    }

    bool Empty() const {
        return Actions_.empty();
    }

    EActionPolicy Policy() const {
        return Policy_;
    }

    void SetPolicy(EActionPolicy policy) {
        Policy_ = policy;
    }

    void Clear() {
        Actions_.clear();
    }

    TFuture<TResult<void>> Execute(const T& data) const {
        auto actions = Actions_;
        auto policy = Policy_;
        size_t failed = 0;
        std::optional<TError> first;

        for (const auto& action : actions) {
            auto res = co_await action.Execute(data);
            if (res) {
                continue;
            }
            ODIN_DEBUG << action.Name() << " failed: " << res.error().ToString();
            if (policy == EActionPolicy::FailFast) {
                co_return res;
            }
            ++failed;
            if (!first) {
                first = res.error();
            }
        }

        if (failed == 0 || policy == EActionPolicy::Ignore) {
            co_return TResult<void>{};
        }
        co_return ActionError(std::to_string(failed) + " of " + std::to_string(actions.size())
            + " actions failed, first: " + first->Message);
    }

private:
    EActionPolicy Policy_;
    std::vector<TAction<T>> Actions_;
};

/**
 * @brief Binds a callable as an action and names it for diagnostics.
 */
template<typename T, typename F>
TAction<T> BindAction(F f, std::string name = "action") {
    return TAction<T>(std::move(f), std::move(name));
}

/**
 * @brief Subscriber binding that turns publisher data into a message for @p target.
 *
 * @p mapper returns a member of the target's message set, or an optional of
 * one where std::nullopt means "nothing to send". Delivery uses TrySend(),
 * so a slow subscriber never blocks the publisher; MailboxFull and
 * ReceiverGone come back as ActionError.
 */
template<typename T, typename TMsgSet, typename F>
TAction<T> SendMsgAction(NActors::TActorHandle<TMsgSet> target, F mapper) {
    auto name = "send to '" + target.Name() + "'";
    return TAction<T>([target = std::move(target), mapper = std::move(mapper)](const T& data) -> TResult<void> {
        auto message = mapper(data);
        using TMessage = decltype(message);
        if constexpr (requires { message.has_value(); *message; }) {
            if (!message) {
                return {};
            }
            auto res = target.TrySend(std::move(*message));
            if (!res) {
                return std::unexpected(MapActionError(res.error()));
            }
        } else {
            static_assert(NActors::CMemberOf<TMessage, TMsgSet>, "mapper must produce a message of the target");
            auto res = target.TrySend(std::move(message));
            if (!res) {
                return std::unexpected(MapActionError(res.error()));
            }
        }
        return {};
    }, std::move(name));
}

} // namespace NAction
} // namespace NOdin
