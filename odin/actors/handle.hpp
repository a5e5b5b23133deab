#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <odin/corochain.hpp>
#include <odin/errors.hpp>

#include "mailbox.hpp"
#include "messages.hpp"

namespace NOdin {
namespace NActors {

/**
 * @class TActorHandle
 * @brief Send capability for an actor accepting message set @p TMsgSet.
 *
 * Handles are cheap to copy and compare equal when they point to the same
 * mailbox. A restarted actor keeps its mailbox, so old handles stay valid.
 * TrySend() and Exec() may be called from any thread; the awaitable
 * operations must run on the loop thread.
 *
 * @code{.cpp}
 * auto greeter = system.Spawn<TGreeter>("greeter", {});
 * greeter.TrySend(TGreet{"world"});
 * auto count = co_await greeter.Ask<size_t>(TCountQuestion{}, std::chrono::seconds(1));
 * @endcode
 */
template<typename TMsgSet>
class TActorHandle {
public:
    using TMessages = TMsgSet;

    TActorHandle() = default;
    explicit TActorHandle(std::shared_ptr<TMailbox<TMsgSet>> mailbox)
        : Mailbox_(std::move(mailbox))
    { }

    /// Fails fast with MailboxFull or ReceiverGone. A MailboxFull refusal counts in Dropped().
    template<CMemberOf<TMsgSet> T>
    TResult<void> TrySend(T&& message) const {
        if (!Mailbox_) {
            return MakeError(EErrorKind::ReceiverGone, "empty handle");
        }
        TMsgSet value(std::forward<T>(message));
        auto res = Mailbox_->TryPush(value);
        if (!res && res.error().Kind == EErrorKind::MailboxFull) {
            Mailbox_->CountDropped();
        }
        return res;
    }

    /// Waits for free space. Fails only with ReceiverGone.
    template<CMemberOf<TMsgSet> T>
    TFuture<TResult<void>> Send(T message) const;

    /// Like Send() but gives up with Timeout after @p timeout.
    template<CMemberOf<TMsgSet> T>
    TFuture<TResult<void>> SendWithTimeout(T message, std::chrono::milliseconds timeout) const;

    /**
     * @brief Fail-fast send retried on the system scheduler.
     *
     * Tries up to @p maxAttempts times, @p delay apart and starting after
     * @p delay, while the mailbox stays full. Stops at the first delivery or
     * at any other error. Success only means the retries are scheduled;
     * running out of attempts counts one dropped message.
     */
    template<CMemberOf<TMsgSet> T>
    TResult<void> RetrySend(T message, size_t maxAttempts, std::chrono::milliseconds delay) const;

    TResult<void> SendSystem(TSystemSignal signal) const {
        if (!Mailbox_) {
            return MakeError(EErrorKind::ReceiverGone, "empty handle");
        }
        return Mailbox_->SendSystem(std::move(signal));
    }

    /// Runs @p closure on the actor's turn, ahead of pending user messages.
    TResult<void> Exec(std::function<void()> closure) const {
        return SendSystem(NSignal::TExec{std::move(closure)});
    }

    /**
     * @brief Request/response over TQuery<Q, A>, which must belong to the message set.
     *
     * Resolves with the answer, Timeout if none arrives within @p timeout,
     * ReceiverGone if the actor drops the query, MailboxFull never: the
     * request waits for space within the same timeout.
     */
    template<typename A, typename Q>
    TFuture<TResult<A>> Ask(Q question, std::chrono::milliseconds timeout) const;

    const std::string& Name() const {
        static const std::string empty;
        return Mailbox_ ? Mailbox_->Name() : empty;
    }

    uint64_t Dropped() const {
        return Mailbox_ ? Mailbox_->Dropped() : 0;
    }

    bool IsAlive() const {
        return Mailbox_ && !Mailbox_->IsClosed();
    }

    explicit operator bool() const {
        return !!Mailbox_;
    }

    bool operator==(const TActorHandle& other) const {
        return Mailbox_ == other.Mailbox_;
    }

    const std::shared_ptr<TMailbox<TMsgSet>>& Mailbox() const {
        return Mailbox_;
    }

private:
    std::shared_ptr<TMailbox<TMsgSet>> Mailbox_;
};

} // namespace NActors
} // namespace NOdin
