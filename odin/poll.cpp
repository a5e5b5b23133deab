#include "poll.hpp"

#include <system_error>

namespace NOdin {

namespace {

short ToPollEvents(int mask) {
    short events = 0;
    if (mask & TEvent::READ) {
        events |= POLLIN;
    }
    if (mask & TEvent::WRITE) {
        events |= POLLOUT;
    }
    return events;
}

} // namespace

void TPoll::Update(int fd, TSlot& slot) {
    short events = ToPollEvents(slot.Interest.Mask());

    if (events != 0) {
        if (slot.Index < 0) {
            slot.Index = static_cast<int>(Fds_.size());
            Fds_.push_back(pollfd{fd, 0, 0});
        }
        Fds_[slot.Index].events = events;
        return;
    }

    if (slot.Index < 0) {
        return;
    }
    // swap with the tail to keep Fds_ dense
    int last = static_cast<int>(Fds_.size()) - 1;
    if (slot.Index != last) {
        Fds_[slot.Index] = Fds_[last];
        Slots_[Fds_[slot.Index].fd].Index = slot.Index;
    }
    Fds_.pop_back();
    slot.Index = -1;
}

void TPoll::Poll() {
    auto timeout = GetTimeout();

    if (MaxFd_ >= static_cast<int>(Slots_.size())) {
        Slots_.resize(MaxFd_ + 1);
    }
    for (const auto& change : Changes_) {
        auto& slot = Slots_[change.Fd];
        slot.Interest.Apply(change);
        Update(change.Fd, slot);
    }

    Reset();

    if (ppoll(Fds_.data(), Fds_.size(), &timeout, nullptr) < 0) {
        if (errno == EINTR) {
            return;
        }
        throw std::system_error(errno, std::generic_category(), "ppoll");
    }

    for (const auto& pfd : Fds_) {
        if (pfd.revents == 0) {
            continue;
        }
        const auto& interest = Slots_[pfd.fd].Interest;
        bool broken = pfd.revents & (POLLHUP | POLLERR | POLLNVAL);
        if (interest.Read && ((pfd.revents & POLLIN) || broken)) {
            ReadyEvents_.push_back(TEvent{pfd.fd, TEvent::READ, interest.Read});
        }
        if (interest.Write && ((pfd.revents & POLLOUT) || broken)) {
            ReadyEvents_.push_back(TEvent{pfd.fd, TEvent::WRITE, interest.Write});
        }
    }

    ProcessTimers();
}

} // namespace NOdin
