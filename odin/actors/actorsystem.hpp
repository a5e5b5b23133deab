#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include <odin/corochain.hpp>
#include <odin/errors.hpp>
#include <odin/log.hpp>
#include <odin/poller.hpp>
#include <odin/socket.hpp>

#include "actor.hpp"
#include "blocking_pool.hpp"
#include "handle.hpp"
#include "mailbox.hpp"
#include "messages.hpp"
#include "scheduler.hpp"

#include <signal.h>

namespace NOdin {
namespace NActors {

struct TSystemOptions {
    size_t MailboxCapacity = 16;
    std::chrono::milliseconds GracePeriod{2000};
    std::chrono::milliseconds SchedulerGranularity{1};
    size_t BlockingThreads = 4;
    // 0 disables the heartbeat
    std::chrono::milliseconds Heartbeat{0};
};

struct TSpawnOptions {
    // 0 means TSystemOptions::MailboxCapacity
    size_t Capacity = 0;
    ESupervision Supervision = ESupervision::Stop;
    uint32_t MaxRestarts = 10;
};

/**
 * @class TCellBase
 * @brief Untyped part of a spawned actor as seen by the registry.
 */
class TCellBase {
public:
    TCellBase(TActorSystem* system, std::shared_ptr<TMailboxBase> mailbox, TSpawnOptions options)
        : System_(system)
        , MailboxBase_(std::move(mailbox))
        , Options_(options)
    { }

    virtual ~TCellBase() = default;

    const std::string& Name() const {
        return MailboxBase_->Name();
    }

    EActorState State() const {
        return State_;
    }

    const std::shared_ptr<TMailboxBase>& MailboxBase() const {
        return MailboxBase_;
    }

    /// Starts the actor loop. Loop thread only.
    virtual void Launch() = 0;

    /// Drops the actor without running OnStop().
    void Kill() {
        MailboxBase_->Close();
        Task_ = {};
        State_ = EActorState::Terminated;
    }

    uint64_t LastPong() const {
        return LastPong_;
    }

    uint64_t PingSent() const {
        return PingSent_;
    }

    void SetPingSent(uint64_t cycle) {
        PingSent_ = cycle;
    }

protected:
    TActorSystem* System_;
    std::shared_ptr<TMailboxBase> MailboxBase_;
    TSpawnOptions Options_;
    EActorState State_ = EActorState::Initializing;
    uint64_t LastPong_ = 0;
    uint64_t PingSent_ = 0;
    TFuture<void> Task_;
};

template<typename TMsgSet>
class TActorCell;

/**
 * @class TActorSystem
 * @brief Registry, scheduler and lifecycle owner for the actors of one process.
 *
 * All actor loops run as coroutines on the thread that drives the poller
 * (the loop thread, which must also construct the system). Other threads
 * talk to the system through Post(), which wakes the loop with an eventfd.
 *
 * @code{.cpp}
 * TLoop<TDefaultPoller> loop;
 * TActorSystem system(&loop.Poller());
 * system.HandleSignals();
 * auto greeter = system.Spawn<TGreeter>("greeter");
 * greeter.TrySend(TGreet{"world"});
 * system.ProcessRequests(loop);
 * @endcode
 */
class TActorSystem {
public:
    explicit TActorSystem(TPollerBase* poller, TSystemOptions options = {});
    ~TActorSystem();

    TActorSystem(const TActorSystem&) = delete;
    TActorSystem& operator=(const TActorSystem&) = delete;

    /**
     * @brief Spawns an actor of type @p TActorType constructed from copies of @p args.
     *
     * A restart builds a fresh instance from the same arguments.
     * @throws TOdinError NameConflict if @p name is taken.
     */
    template<typename TActorType, typename... TArgs>
    TActorHandle<typename TActorType::TMessages> Spawn(const std::string& name, TSpawnOptions options = {}, TArgs&&... args) {
        using TMsgSet = typename TActorType::TMessages;
        auto factory = [args = std::make_tuple(std::decay_t<TArgs>(std::forward<TArgs>(args))...)]() {
            return std::apply([](const auto&... a) -> std::unique_ptr<IActor<TMsgSet>> {
                return std::make_unique<TActorType>(a...);
            }, args);
        };
        return SpawnWith<TMsgSet>(name, std::move(factory), options);
    }

    template<typename TMsgSet>
    TActorHandle<TMsgSet> SpawnWith(const std::string& name, std::function<std::unique_ptr<IActor<TMsgSet>>()> factory, TSpawnOptions options = {});

    /// Handle of a live actor, nullopt if there is none or its message set differs.
    template<typename TMsgSet>
    std::optional<TActorHandle<TMsgSet>> Lookup(const std::string& name) const {
        std::lock_guard guard(RegistryMutex_);
        auto it = Cells_.find(name);
        if (it == Cells_.end()) {
            return std::nullopt;
        }
        auto mailbox = std::dynamic_pointer_cast<TMailbox<TMsgSet>>(it->second->MailboxBase());
        if (!mailbox) {
            return std::nullopt;
        }
        return TActorHandle<TMsgSet>(std::move(mailbox));
    }

    size_t ActorsSize() const;

    TScheduler& Scheduler() {
        return *Scheduler_;
    }

    TPollerBase* Poller() const {
        return Poller_;
    }

    const TSystemOptions& Options() const {
        return Options_;
    }

    /// Runs @p fn on the loop thread during the next drain. Any thread.
    void Post(std::function<void()> fn);

    /// Fires @p slot on the loop thread. Any thread.
    void Wake(std::shared_ptr<TParked> slot) {
        Post([slot = std::move(slot)]() { slot->Fire(); });
    }

    bool IsLoopThread() const {
        return std::this_thread::get_id() == LoopThread_;
    }

    /// Runs @p fn on the blocking pool and resumes the caller on the loop thread.
    template<typename F>
    auto Offload(F fn) -> TFuture<std::invoke_result_t<F>>;

    /// Starts the shutdown sequence. Any thread, idempotent.
    void Shutdown();

    bool ShutdownRequested() const {
        return ShutdownRequested_.load();
    }

    /// True once every actor stopped or was dropped.
    bool Finished() const {
        return Finished_.load();
    }

    /// Steps @p loop until the shutdown sequence has finished.
    template<typename TLoop>
    void ProcessRequests(TLoop& loop) {
        while (!Finished()) {
            loop.Step();
        }
    }

    /// Turns the given process signals into Shutdown(). Blocks them on the calling thread.
    void HandleSignals(const std::vector<int>& signals = {SIGINT, SIGTERM});

    /// Called by an actor loop right before it exits.
    void OnActorTerminated(TCellBase* cell);

private:
    void Register(std::shared_ptr<TCellBase> cell);
    void Drain();
    void Heartbeat();
    std::vector<std::shared_ptr<TCellBase>> Cells() const;

    TFuture<void> DrainLoop();
    TFuture<void> ReadWakeups();
    TFuture<void> ReadSignals();
    TFuture<void> RunShutdown();

    TPollerBase* Poller_;
    TSystemOptions Options_;
    std::thread::id LoopThread_;

    std::unique_ptr<TScheduler> Scheduler_;
    std::unique_ptr<TBlockingPool> Pool_;

    mutable std::mutex RegistryMutex_;
    std::unordered_map<std::string, std::shared_ptr<TCellBase>> Cells_;
    std::vector<std::shared_ptr<TCellBase>> Graveyard_;

    std::mutex PostMutex_;
    std::vector<std::function<void()>> Posted_;
    bool DrainScheduled_ = false;
    bool Stopped_ = false;
    // poller timers that resume DrainTask_, fire in id order
    std::deque<unsigned> DrainTimers_;
    int WakeFd_ = -1;
    std::unique_ptr<TFileHandle> WakeFile_;
    std::unique_ptr<TFileHandle> SignalFile_;

    std::atomic<bool> ShutdownRequested_ = false;
    std::atomic<bool> Finished_ = false;
    std::shared_ptr<TParked> Quiescent_;

    uint64_t HeartbeatCycle_ = 0;
    TScheduler::TToken HeartbeatToken_ = 0;

    TFuture<void> DrainTask_;
    TFuture<void> WakeTask_;
    TFuture<void> SignalTask_;
    TFuture<void> ShutdownTask_;
};

/**
 * @class TActorCell
 * @brief Runs one actor: the receive loop, hooks, supervision and restarts.
 */
template<typename TMsgSet>
class TActorCell: public TCellBase {
public:
    using TFactory = std::function<std::unique_ptr<IActor<TMsgSet>>()>;

    TActorCell(TActorSystem* system, std::shared_ptr<TMailbox<TMsgSet>> mailbox, TFactory factory, TSpawnOptions options)
        : TCellBase(system, mailbox, options)
        , Mailbox_(mailbox)
        , Factory_(std::move(factory))
        , Timers_(system, mailbox)
        , Context_(system, TActorHandle<TMsgSet>(mailbox), &Timers_)
    { }

    void Launch() override {
        Task_ = Run();
    }

private:
    TFuture<void> Run() {
        bool running = Build();
        while (running) {
            co_await TParkAwaiter(Mailbox_->WaitWork(!Paused_ && State_ == EActorState::Running));
            if (auto signal = Mailbox_->TakeSignal()) {
                running = co_await HandleSignal(std::move(*signal));
                continue;
            }
            if (Mailbox_->IsClosed()) {
                break;
            }
            if (Paused_ || State_ != EActorState::Running) {
                continue;
            }
            auto message = Mailbox_->TakeMessage();
            if (!message) {
                continue;
            }
            TReceiveAction action;
            try {
                action = co_await Actor_->Receive(std::move(*message), Context_);
            } catch (const std::exception& ex) {
                action = Failed("handler", ex.what());
            } catch (...) {
                action = Failed("handler", "unknown exception");
            }
            running = co_await Apply(std::move(action));
        }

        co_await Terminate();
        System_->OnActorTerminated(this);
    }

    bool Build() {
        try {
            Actor_ = Factory_();
            return true;
        } catch (const std::exception& ex) {
            ODIN_ERROR << "actor '" << Name() << "' construction failed: " << ex.what();
            return false;
        }
    }

    TReceiveAction Failed(const char* where, const std::string& what) {
        return TReceiveAction::StopError(TError{EErrorKind::Internal, std::string(where) + " of '" + Name() + "' threw: " + what});
    }

    TFuture<bool> HandleSignal(TSystemSignal signal) {
        if (std::holds_alternative<NSignal::TStart>(signal)) {
            if (State_ != EActorState::Initializing) {
                co_return true;
            }
            State_ = EActorState::Running;
            auto started = co_await CallStart();
            co_return co_await Apply(std::move(started));
        } else if (std::holds_alternative<NSignal::TTerminate>(signal)) {
            co_return false;
        } else if (auto* timer = std::get_if<NSignal::TTimer>(&signal)) {
            auto coalesced = Timers_.Accept(*timer);
            if (coalesced == 0 || State_ != EActorState::Running) {
                Timers_.Done(*timer);
                co_return true;
            }
            TReceiveAction action;
            try {
                action = co_await Actor_->OnTimer(timer->Id, coalesced, Context_);
            } catch (const std::exception& ex) {
                action = Failed("OnTimer", ex.what());
            } catch (...) {
                action = Failed("OnTimer", "unknown exception");
            }
            Timers_.Done(*timer);
            co_return co_await Apply(std::move(action));
        } else if (auto* exec = std::get_if<NSignal::TExec>(&signal)) {
            TReceiveAction action;
            try {
                exec->Closure();
            } catch (const std::exception& ex) {
                action = Failed("exec closure", ex.what());
            } catch (...) {
                action = Failed("exec closure", "unknown exception");
            }
            co_return co_await Apply(std::move(action));
        } else if (std::holds_alternative<NSignal::TPause>(signal)) {
            Paused_ = true;
        } else if (std::holds_alternative<NSignal::TResume>(signal)) {
            Paused_ = false;
        } else if (auto* ping = std::get_if<NSignal::TPing>(&signal)) {
            LastPong_ = ping->Cycle;
        }
        co_return true;
    }

    TFuture<TReceiveAction> CallStart() {
        try {
            co_await Actor_->OnStart(Context_);
        } catch (const std::exception& ex) {
            co_return Failed("OnStart", ex.what());
        } catch (...) {
            co_return Failed("OnStart", "unknown exception");
        }
        co_return TReceiveAction::Continue();
    }

    TFuture<void> CallStop() {
        try {
            co_await Actor_->OnStop(Context_);
        } catch (const std::exception& ex) {
            ODIN_ERROR << "OnStop of '" << Name() << "' threw: " << ex.what();
        } catch (...) {
            ODIN_ERROR << "OnStop of '" << Name() << "' threw an unknown exception";
        }
    }

    // false: leave the receive loop
    TFuture<bool> Apply(TReceiveAction action) {
        using EKind = TReceiveAction::EKind;
        switch (action.Kind) {
        case EKind::Continue:
            co_return true;
        case EKind::Stop:
            co_return false;
        case EKind::RequestTermination:
            System_->Shutdown();
            co_return true;
        case EKind::Restart:
            co_return co_await Restart();
        case EKind::StopError:
            break;
        }

        ODIN_ERROR << "actor '" << Name() << "' failed: " << action.Error.ToString();
        switch (Options_.Supervision) {
        case ESupervision::Stop:
            co_return false;
        case ESupervision::Restart:
            co_return co_await Restart();
        case ESupervision::Escalate:
            ODIN_ERROR << "escalating failure of '" << Name() << "' to the actor system";
            System_->Shutdown();
            co_return false;
        }
        co_return false;
    }

    TFuture<bool> Restart() {
        if (Restarts_ >= Options_.MaxRestarts) {
            ODIN_ERROR << "actor '" << Name() << "' exceeded " << Options_.MaxRestarts << " restarts";
            co_return false;
        }
        ++Restarts_;
        ODIN_WARN << "restarting actor '" << Name() << "' (" << Restarts_ << ")";
        co_await CallStop();
        Mailbox_->DropMessages();
        Timers_.CancelAll();
        Paused_ = false;
        if (!Build()) {
            Actor_.reset();
            co_return false;
        }
        auto started = co_await CallStart();
        co_return co_await Apply(std::move(started));
    }

    TFuture<void> Terminate() {
        State_ = EActorState::Stopping;
        Mailbox_->Close();
        Timers_.CancelAll();
        if (Actor_) {
            co_await CallStop();
        }
        State_ = EActorState::Terminated;
        ODIN_DEBUG << "actor '" << Name() << "' terminated";
    }

    std::shared_ptr<TMailbox<TMsgSet>> Mailbox_;
    TFactory Factory_;
    TActorTimers Timers_;
    TActorContext<TMsgSet> Context_;
    std::unique_ptr<IActor<TMsgSet>> Actor_;
    bool Paused_ = false;
    uint32_t Restarts_ = 0;
};

template<typename TMsgSet>
TActorHandle<TMsgSet> TActorSystem::SpawnWith(const std::string& name, std::function<std::unique_ptr<IActor<TMsgSet>>()> factory, TSpawnOptions options) {
    if (name.empty()) {
        throw TOdinError(EErrorKind::ConfigError, "actor name must not be empty");
    }
    if (ShutdownRequested()) {
        throw TOdinError(EErrorKind::Internal, "cannot spawn '" + name + "': actor system is shutting down");
    }
    auto capacity = options.Capacity ? options.Capacity : Options_.MailboxCapacity;
    auto mailbox = std::make_shared<TMailbox<TMsgSet>>(this, name, capacity);
    auto cell = std::make_shared<TActorCell<TMsgSet>>(this, mailbox, std::move(factory), options);
    Register(cell);
    if (auto res = mailbox->SendSystem(NSignal::TStart{}); !res) {
        throw TOdinError(res.error());
    }
    Post([cell]() { cell->Launch(); });
    ODIN_DEBUG << "spawned actor '" << name << "' with capacity " << capacity;
    return TActorHandle<TMsgSet>(std::move(mailbox));
}

template<typename F>
auto TActorSystem::Offload(F fn) -> TFuture<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    using TValue = std::conditional_t<std::is_void_v<R>, std::monostate, R>;
    struct TState {
        std::shared_ptr<TParked> Parked = std::make_shared<TParked>();
        std::optional<TValue> Value;
        std::exception_ptr Error;
    };

    auto state = std::make_shared<TState>();
    bool submitted = Pool_->Submit([this, state, fn = std::move(fn)]() mutable {
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                state->Value.emplace();
            } else {
                state->Value.emplace(fn());
            }
        } catch (...) {
            state->Error = std::current_exception();
        }
        Wake(state->Parked);
    });
    if (!submitted) {
        throw TOdinError(EErrorKind::ReceiverGone, "blocking pool is stopped");
    }

    co_await TParkAwaiter(state->Parked);
    if (state->Error) {
        std::rethrow_exception(state->Error);
    }
    if constexpr (!std::is_void_v<R>) {
        co_return std::move(*state->Value);
    }
}

namespace NDetail {

// Pushes @p message, waiting for space until @p deadline (forever if unset).
template<typename TMsgSet>
TFuture<TResult<void>> SendUntil(std::shared_ptr<TMailbox<TMsgSet>> mailbox, TMsgSet message, std::optional<TTime> deadline) {
    if (!mailbox) {
        co_return MakeError(EErrorKind::ReceiverGone, "empty handle");
    }
    auto* system = mailbox->System();
    while (true) {
        auto res = mailbox->TryPush(message);
        if (res || res.error().Kind != EErrorKind::MailboxFull) {
            co_return res;
        }
        if (deadline && TClock::now() >= *deadline) {
            co_return MakeError(EErrorKind::Timeout, "send to '" + mailbox->Name() + "' timed out");
        }
        auto slot = mailbox->WaitSpace();
        TScheduler::TToken token = 0;
        if (deadline) {
            token = system->Scheduler().ScheduleCallback(*deadline, [slot]() { slot->Fire(); });
        }
        co_await TParkAwaiter(slot);
        if (token) {
            system->Scheduler().Cancel(token);
        }
    }
}

} // namespace NDetail

template<typename TMsgSet>
template<CMemberOf<TMsgSet> T>
TFuture<TResult<void>> TActorHandle<TMsgSet>::Send(T message) const {
    return NDetail::SendUntil(Mailbox_, TMsgSet(std::move(message)), std::nullopt);
}

template<typename TMsgSet>
template<CMemberOf<TMsgSet> T>
TFuture<TResult<void>> TActorHandle<TMsgSet>::SendWithTimeout(T message, std::chrono::milliseconds timeout) const {
    return NDetail::SendUntil(Mailbox_, TMsgSet(std::move(message)), TClock::now() + timeout);
}

template<typename TMsgSet>
template<CMemberOf<TMsgSet> T>
TResult<void> TActorHandle<TMsgSet>::RetrySend(T message, size_t maxAttempts, std::chrono::milliseconds delay) const {
    if (!Mailbox_) {
        return MakeError(EErrorKind::ReceiverGone, "empty handle");
    }
    if (maxAttempts == 0 || delay.count() <= 0) {
        return MakeError(EErrorKind::ConfigError, "retry of '" + Mailbox_->Name() + "' needs attempts and a positive delay");
    }
    auto* system = Mailbox_->System();
    if (system->ShutdownRequested()) {
        return MakeError(EErrorKind::ReceiverGone, "cannot schedule retry for '" + Mailbox_->Name() + "' during shutdown");
    }

    auto pending = std::make_shared<TMsgSet>(std::move(message));
    auto remaining = std::make_shared<size_t>(maxAttempts);
    system->Scheduler().ScheduleRepeatingCallback(TClock::now() + delay, delay,
        [mailbox = Mailbox_, pending, remaining](uint32_t) {
            auto res = mailbox->TryPush(*pending);
            if (res || res.error().Kind != EErrorKind::MailboxFull) {
                return false;
            }
            if (--*remaining > 0) {
                return true;
            }
            mailbox->CountDropped();
            ODIN_WARN << "message for '" << mailbox->Name() << "' dropped after retries: mailbox is full";
            return false;
        });
    return {};
}

template<typename TMsgSet>
template<typename A, typename Q>
TFuture<TResult<A>> TActorHandle<TMsgSet>::Ask(Q question, std::chrono::milliseconds timeout) const {
    static_assert(CMemberOf<TQuery<Q, A>, TMsgSet>, "TQuery<Q, A> must belong to the message set");
    auto mailbox = Mailbox_;
    if (!mailbox) {
        co_return MakeError(EErrorKind::ReceiverGone, "empty handle");
    }
    auto* system = mailbox->System();
    auto deadline = TClock::now() + timeout;
    auto slot = std::make_shared<TReplySlot<A>>(system);

    TMsgSet message(TQuery<Q, A>(std::move(question), slot));
    auto sent = co_await NDetail::SendUntil(mailbox, std::move(message), deadline);
    if (!sent) {
        co_return std::unexpected(sent.error());
    }

    auto token = system->Scheduler().ScheduleCallback(deadline, [slot, name = mailbox->Name()]() {
        slot->Resolve(MakeError(EErrorKind::Timeout, "no answer from '" + name + "'"));
    });
    co_await TParkAwaiter(slot->Parked);
    system->Scheduler().Cancel(token);
    co_return std::move(*slot->Reply);
}

template<typename A>
void TReplySlot<A>::Post(const std::shared_ptr<TReplySlot>& slot, TResult<A> result) {
    slot->System->Post([slot, result = std::move(result)]() mutable {
        slot->Resolve(std::move(result));
    });
}

template<typename TMsgSet>
TFuture<void> TActorContext<TMsgSet>::Sleep(std::chrono::milliseconds duration) {
    co_await System_->Poller()->Sleep(duration);
}

template<typename TMsgSet>
template<typename F>
auto TActorContext<TMsgSet>::Offload(F fn) {
    return System_->Offload(std::move(fn));
}

} // namespace NActors
} // namespace NOdin
