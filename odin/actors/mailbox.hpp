#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <odin/errors.hpp>
#include <odin/promises.hpp>

#include "messages.hpp"
#include "queue.hpp"

namespace NOdin {
namespace NActors {

/**
 * @class TMailboxBase
 * @brief Untyped half of a mailbox: system lane, closure and wakeups.
 *
 * Producers may live on any thread, the single consumer is the actor loop
 * on the loop thread. Wakeups never resume anybody inline; they are posted
 * to the actor system and run on the next drain.
 */
class TMailboxBase {
public:
    TMailboxBase(TActorSystem* system, std::string name, size_t capacity);
    virtual ~TMailboxBase() = default;

    TMailboxBase(const TMailboxBase&) = delete;
    TMailboxBase& operator=(const TMailboxBase&) = delete;

    const std::string& Name() const {
        return Name_;
    }

    size_t Capacity() const {
        return Capacity_;
    }

    TActorSystem* System() const {
        return System_;
    }

    bool IsClosed() const;

    /// Number of pending user messages.
    size_t Size() const;

    /// User messages refused by fail-fast sends because the mailbox was full.
    uint64_t Dropped() const {
        return Dropped_.load(std::memory_order_relaxed);
    }

    void CountDropped() {
        Dropped_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Never blocks. Fails only with ReceiverGone.
    TResult<void> SendSystem(TSystemSignal signal);

    /**
     * @brief Returns a slot that fires once there is something to take.
     *
     * With @p userEnabled false only system signals count (paused actor).
     * The slot is already fired if work is available right now or the
     * mailbox is closed.
     */
    std::shared_ptr<TParked> WaitWork(bool userEnabled);

    /// Returns a slot that fires once a user message may fit or the mailbox closes.
    std::shared_ptr<TParked> WaitSpace();

    std::optional<TSystemSignal> TakeSignal();

    /// Refuses further sends and drops everything pending.
    void Close();

    /// Drops pending user messages, keeps the mailbox open.
    void DropMessages();

protected:
    virtual size_t UserSizeLocked() const = 0;
    virtual void ClearUserLocked() = 0;

    // Wakes the consumer if it waits for this kind of work. Called with
    // Mutex_ held through @p lock, releases it.
    void NotifyConsumer(std::unique_lock<std::mutex>& lock, bool userWork);
    void NotifySpace(std::unique_lock<std::mutex>& lock);

    mutable std::mutex Mutex_;
    bool Closed_ = false;
    std::atomic<uint64_t> Dropped_{0};

private:
    TActorSystem* System_;
    std::string Name_;
    size_t Capacity_;

    TRingQueue<TSystemSignal> Signals_;
    std::shared_ptr<TParked> Consumer_;
    bool ConsumerWantsUser_ = true;
    std::vector<std::shared_ptr<TParked>> SpaceWaiters_;
};

/// Bounded typed lane on top of TMailboxBase.
template<typename TMsgSet>
class TMailbox: public TMailboxBase {
public:
    TMailbox(TActorSystem* system, std::string name, size_t capacity)
        : TMailboxBase(system, std::move(name), capacity)
        , Messages_(capacity)
    { }

    /// Moves @p message in on success, leaves it intact on failure.
    TResult<void> TryPush(TMsgSet& message) {
        std::unique_lock lock(Mutex_);
        if (Closed_) {
            return MakeError(EErrorKind::ReceiverGone, "actor '" + Name() + "' is gone");
        }
        if (Messages_.Size() >= Capacity()) {
            return MakeError(EErrorKind::MailboxFull, "mailbox of '" + Name() + "' is full");
        }
        Messages_.Push(std::move(message));
        NotifyConsumer(lock, true);
        return {};
    }

    std::optional<TMsgSet> TakeMessage() {
        std::unique_lock lock(Mutex_);
        if (Messages_.Empty()) {
            return std::nullopt;
        }
        std::optional<TMsgSet> message(Messages_.Take());
        NotifySpace(lock);
        return message;
    }

protected:
    size_t UserSizeLocked() const override {
        return Messages_.Size();
    }

    void ClearUserLocked() override {
        Messages_.Clear();
    }

private:
    TRingQueue<TMsgSet> Messages_;
};

} // namespace NActors
} // namespace NOdin
