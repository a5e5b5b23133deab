#pragma once

#include <chrono>
#include <memory>
#include <type_traits>
#include <unordered_map>

#include <odin/corochain.hpp>

#include "handle.hpp"
#include "messages.hpp"

namespace NOdin {
namespace NActors {

/**
 * @brief Timers owned by one actor.
 *
 * Each timer id maps to a scheduler job that emits NSignal::TTimer into the
 * actor's system lane. A repeating timer has at most one tick in flight;
 * ticks that fire meanwhile are counted and reported as "coalesced".
 */
class TActorTimers {
public:
    TActorTimers(TActorSystem* system, std::weak_ptr<TMailboxBase> mailbox)
        : System_(system)
        , Mailbox_(std::move(mailbox))
    { }

    ~TActorTimers();

    TActorTimers(const TActorTimers&) = delete;
    TActorTimers& operator=(const TActorTimers&) = delete;

    /// (Re)starts timer @p id. A running timer with the same id is replaced.
    void Start(TTimerId id, std::chrono::milliseconds delay, std::chrono::milliseconds interval, bool repeat);
    void Cancel(TTimerId id);
    void CancelAll();

    /**
     * @brief Called by the actor loop for a delivered tick.
     * @return number of ticks the delivery stands for, 0 if the tick is stale
     */
    uint32_t Accept(const NSignal::TTimer& timer);

    /// Releases the in-flight mark once the handler returned.
    void Done(const NSignal::TTimer& timer);

    size_t Size() const {
        return Timers_.size();
    }

private:
    struct TEntry {
        uint64_t Token = 0;
        std::shared_ptr<TTimerTick> Tick;
        bool Repeat = false;
    };

    TActorSystem* System_;
    std::weak_ptr<TMailboxBase> Mailbox_;
    std::unordered_map<TTimerId, TEntry> Timers_;
};

/**
 * @class TActorContext
 * @brief Per-actor services available to handlers.
 */
template<typename TMsgSet>
class TActorContext {
public:
    TActorContext(TActorSystem* system, TActorHandle<TMsgSet> self, TActorTimers* timers)
        : System_(system)
        , Self_(std::move(self))
        , Timers_(timers)
    { }

    const TActorHandle<TMsgSet>& Self() const {
        return Self_;
    }

    const std::string& Name() const {
        return Self_.Name();
    }

    TActorSystem& System() const {
        return *System_;
    }

    /// One-shot timer, delivered to OnTimer(id, 1, ctx) after @p delay.
    void StartTimer(TTimerId id, std::chrono::milliseconds delay) {
        Timers_->Start(id, delay, delay, false);
    }

    /// Repeating timer. With @p instantly the first tick is due right away.
    void StartRepeatTimer(TTimerId id, std::chrono::milliseconds interval, bool instantly = false) {
        Timers_->Start(id, instantly ? std::chrono::milliseconds(0) : interval, interval, true);
    }

    void CancelTimer(TTimerId id) {
        Timers_->Cancel(id);
    }

    TFuture<void> Sleep(std::chrono::milliseconds duration);

    /// Runs @p fn on the blocking pool.
    template<typename F>
    auto Offload(F fn);

private:
    TActorSystem* System_;
    TActorHandle<TMsgSet> Self_;
    TActorTimers* Timers_;
};

/**
 * @class IActor
 * @brief Type-erased actor behaviour driven by the actor loop.
 *
 * Most actors derive from TActor, which implements Receive() by visiting
 * the message set.
 */
template<typename TMsgSet>
class IActor {
public:
    using TMessages = TMsgSet;
    using TContext = TActorContext<TMsgSet>;

    virtual ~IActor() = default;

    virtual TFuture<TReceiveAction> Receive(TMsgSet&& message, TContext& ctx) = 0;

    virtual TFuture<void> OnStart(TContext&) {
        co_return;
    }

    virtual TFuture<void> OnStop(TContext&) {
        co_return;
    }

    /// @p coalesced is the number of timer periods this call stands for.
    virtual TFuture<TReceiveAction> OnTimer(TTimerId, uint32_t /*coalesced*/, TContext&) {
        co_return TReceiveAction::Continue();
    }
};

/**
 * @class TActor
 * @brief CRTP base dispatching each alternative of @p TMsgSet to an overload
 * of TDerived::Receive(T, ctx).
 *
 * A missing overload is a compile error. An overload may return void,
 * TReceiveAction, TFuture<void> or TFuture<TReceiveAction>.
 *
 * @code{.cpp}
 * class TGreeter: public TActor<TGreeter, TMessageSet<TGreet>> {
 * public:
 *     void Receive(TGreet&& greet, TContext&) {
 *         std::cout << "hello " << greet.Name << "\n";
 *     }
 * };
 * @endcode
 */
template<typename TDerived, typename TMsgSet>
class TActor: public IActor<TMsgSet> {
public:
    using TContext = TActorContext<TMsgSet>;

    TFuture<TReceiveAction> Receive(TMsgSet&& message, TContext& ctx) override {
        return std::visit([this, &ctx](auto&& value) {
            return HandleMessage(std::move(value), ctx);
        }, std::move(message));
    }

private:
    template<typename TMessage>
    TFuture<TReceiveAction> HandleMessage(TMessage message, TContext& ctx) {
        auto* self = static_cast<TDerived*>(this);
        using TReturn = decltype(self->Receive(std::move(message), ctx));

        if constexpr (std::is_same_v<TReturn, void>) {
            self->Receive(std::move(message), ctx);
            co_return TReceiveAction::Continue();
        } else if constexpr (std::is_same_v<TReturn, TReceiveAction>) {
            co_return self->Receive(std::move(message), ctx);
        } else if constexpr (std::is_same_v<TReturn, TFuture<void>>) {
            co_await self->Receive(std::move(message), ctx);
            co_return TReceiveAction::Continue();
        } else {
            static_assert(std::is_same_v<TReturn, TFuture<TReceiveAction>>,
                "Receive must return void, TReceiveAction, TFuture<void> or TFuture<TReceiveAction>");
            co_return co_await self->Receive(std::move(message), ctx);
        }
    }
};

} // namespace NActors
} // namespace NOdin
