#include "mailbox.hpp"
#include "actorsystem.hpp"

namespace NOdin {
namespace NActors {

TMailboxBase::TMailboxBase(TActorSystem* system, std::string name, size_t capacity)
    : System_(system)
    , Name_(std::move(name))
    , Capacity_(capacity)
{ }

bool TMailboxBase::IsClosed() const {
    std::lock_guard guard(Mutex_);
    return Closed_;
}

size_t TMailboxBase::Size() const {
    std::lock_guard guard(Mutex_);
    return UserSizeLocked();
}

TResult<void> TMailboxBase::SendSystem(TSystemSignal signal) {
    std::unique_lock lock(Mutex_);
    if (Closed_) {
        return MakeError(EErrorKind::ReceiverGone, "actor '" + Name_ + "' is gone");
    }
    Signals_.Push(std::move(signal));
    NotifyConsumer(lock, false);
    return {};
}

std::shared_ptr<TParked> TMailboxBase::WaitWork(bool userEnabled) {
    auto slot = std::make_shared<TParked>();
    std::lock_guard guard(Mutex_);
    if (Closed_ || !Signals_.Empty() || (userEnabled && UserSizeLocked() > 0)) {
        slot->Fired = true;
    } else {
        Consumer_ = slot;
        ConsumerWantsUser_ = userEnabled;
    }
    return slot;
}

std::shared_ptr<TParked> TMailboxBase::WaitSpace() {
    auto slot = std::make_shared<TParked>();
    std::lock_guard guard(Mutex_);
    if (Closed_ || UserSizeLocked() < Capacity_) {
        slot->Fired = true;
    } else {
        SpaceWaiters_.emplace_back(slot);
    }
    return slot;
}

std::optional<TSystemSignal> TMailboxBase::TakeSignal() {
    std::lock_guard guard(Mutex_);
    if (Signals_.Empty()) {
        return std::nullopt;
    }
    return Signals_.Take();
}

void TMailboxBase::Close() {
    std::unique_lock lock(Mutex_);
    if (Closed_) {
        return;
    }
    Closed_ = true;
    ClearUserLocked();
    Signals_.Clear();
    auto consumer = std::move(Consumer_);
    Consumer_.reset();
    NotifySpace(lock);
    if (consumer) {
        System_->Wake(std::move(consumer));
    }
}

void TMailboxBase::DropMessages() {
    std::unique_lock lock(Mutex_);
    ClearUserLocked();
    NotifySpace(lock);
}

void TMailboxBase::NotifyConsumer(std::unique_lock<std::mutex>& lock, bool userWork) {
    std::shared_ptr<TParked> consumer;
    if (Consumer_ && (!userWork || ConsumerWantsUser_)) {
        consumer = std::move(Consumer_);
    }
    lock.unlock();
    if (consumer) {
        System_->Wake(std::move(consumer));
    }
}

void TMailboxBase::NotifySpace(std::unique_lock<std::mutex>& lock) {
    auto waiters = std::move(SpaceWaiters_);
    SpaceWaiters_.clear();
    lock.unlock();
    for (auto& waiter : waiters) {
        System_->Wake(std::move(waiter));
    }
}

} // namespace NActors
} // namespace NOdin
