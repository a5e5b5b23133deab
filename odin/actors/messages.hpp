#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <variant>

#include <odin/errors.hpp>
#include <odin/promises.hpp>

namespace NOdin {
namespace NActors {

class TActorSystem;

/**
 * @brief Closed set of messages an actor accepts.
 *
 * @code{.cpp}
 * struct TGreet { std::string Name; };
 * struct TBye { };
 * using TGreeterMessages = TMessageSet<TGreet, TBye>;
 * @endcode
 */
template<typename... TMessages>
using TMessageSet = std::variant<TMessages...>;

template<typename T, typename TSet>
struct TIsMember: std::false_type { };

template<typename T, typename... TMessages>
struct TIsMember<T, std::variant<TMessages...>>
    : std::bool_constant<(std::is_same_v<T, TMessages> || ...)>
{ };

/// True if @p T is one of the alternatives of message set @p TSet.
template<typename T, typename TSet>
concept CMemberOf = TIsMember<std::decay_t<T>, TSet>::value;

using TTimerId = uint64_t;

// Coalescing state of one actor timer, shared by the scheduler job and the
// signals it emits. Touched on the loop thread only.
struct TTimerTick {
    bool InFlight = false;
    uint32_t Missed = 0;
};

namespace NSignal {

struct TStart { };
struct TTerminate { };

struct TTimer {
    TTimerId Id = 0;
    std::shared_ptr<TTimerTick> Tick;
};

struct TExec {
    std::function<void()> Closure;
};

struct TPause { };
struct TResume { };

struct TPing {
    uint64_t Cycle = 0;
};

} // namespace NSignal

/// Lifecycle signals. They bypass the mailbox bound and are handled before
/// any pending user message.
using TSystemSignal = std::variant<
    NSignal::TStart,
    NSignal::TTerminate,
    NSignal::TTimer,
    NSignal::TExec,
    NSignal::TPause,
    NSignal::TResume,
    NSignal::TPing>;

enum class EActorState {
    Initializing,
    Running,
    Stopping,
    Terminated,
};

const char* ToString(EActorState state);

enum class ESupervision {
    Stop,
    Restart,
    Escalate,
};

/// What the actor loop does after a handler returns.
struct TReceiveAction {
    enum class EKind {
        Continue,
        Stop,
        StopError,
        Restart,
        RequestTermination,
    };

    EKind Kind = EKind::Continue;
    TError Error;

    static TReceiveAction Continue() {
        return {};
    }

    static TReceiveAction Stop() {
        return {EKind::Stop, {}};
    }

    static TReceiveAction StopError(TError error) {
        return {EKind::StopError, std::move(error)};
    }

    static TReceiveAction Restart() {
        return {EKind::Restart, {}};
    }

    /// Asks the actor system to shut down; the actor itself keeps running
    /// until it receives Terminate.
    static TReceiveAction RequestTermination() {
        return {EKind::RequestTermination, {}};
    }
};

/// Where an Ask() waits for its answer.
template<typename A>
struct TReplySlot {
    explicit TReplySlot(TActorSystem* system)
        : System(system)
    { }

    // Loop thread. The first result wins.
    void Resolve(TResult<A> result) {
        if (!Reply) {
            Reply = std::move(result);
            Parked->Fire();
        }
    }

    /// Thread-safe: hops to the loop thread and resolves @p slot there.
    static void Post(const std::shared_ptr<TReplySlot>& slot, TResult<A> result);

    TActorSystem* System;
    std::shared_ptr<TParked> Parked = std::make_shared<TParked>();
    std::optional<TResult<A>> Reply;
};

template<typename A>
class TResponder {
public:
    explicit TResponder(std::shared_ptr<TReplySlot<A>> slot)
        : Slot_(std::move(slot))
    { }

    TResponder(const TResponder&) = delete;
    TResponder& operator=(const TResponder&) = delete;

    ~TResponder() {
        if (!Answered_) {
            TReplySlot<A>::Post(Slot_, MakeError(EErrorKind::ReceiverGone, "query dropped without an answer"));
        }
    }

    void Respond(A answer) {
        if (!Answered_) {
            Answered_ = true;
            TReplySlot<A>::Post(Slot_, std::move(answer));
        }
    }

private:
    std::shared_ptr<TReplySlot<A>> Slot_;
    bool Answered_ = false;
};

/**
 * @brief Request carrying a reply channel, used with TActorHandle::Ask().
 *
 * The responder answers with Respond(). If every copy of the query is
 * destroyed without an answer (the actor stopped, the message was dropped)
 * the asker gets ReceiverGone.
 */
template<typename Q, typename A>
struct TQuery {
    using TQuestion = Q;
    using TAnswer = A;

    TQuery(Q question, std::shared_ptr<TReplySlot<A>> slot)
        : Question(std::move(question))
        , Responder_(std::make_shared<TResponder<A>>(std::move(slot)))
    { }

    void Respond(A answer) const {
        Responder_->Respond(std::move(answer));
    }

    Q Question;

private:
    std::shared_ptr<TResponder<A>> Responder_;
};

} // namespace NActors
} // namespace NOdin
