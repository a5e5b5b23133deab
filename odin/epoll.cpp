#include "epoll.hpp"

#include <unistd.h>

#include <system_error>

namespace NOdin {

namespace {

uint32_t ToEpollEvents(int mask) {
    uint32_t events = 0;
    if (mask & TEvent::READ) {
        events |= EPOLLIN;
    }
    if (mask & TEvent::WRITE) {
        events |= EPOLLOUT;
    }
    return events;
}

int Control(int epfd, int op, int fd, int mask) {
    epoll_event ev = {};
    ev.events = ToEpollEvents(mask);
    ev.data.fd = fd;
    return epoll_ctl(epfd, op, fd, op == EPOLL_CTL_DEL ? nullptr : &ev) < 0 ? errno : 0;
}

[[noreturn]] void ThrowCtl(int err) {
    throw std::system_error(err, std::generic_category(), "epoll_ctl");
}

} // namespace

TEPoll::TEPoll()
    : Fd_(epoll_create1(EPOLL_CLOEXEC))
{
    if (Fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "epoll_create1");
    }
}

TEPoll::~TEPoll()
{
    close(Fd_);
}

void TEPoll::Sync(int fd, TRegistration& reg) {
    int wanted = reg.Interest.Mask();
    if (wanted == reg.Registered) {
        return;
    }

    int err = 0;
    if (wanted == 0) {
        // close() already dropped the descriptor from the set
        err = Control(Fd_, EPOLL_CTL_DEL, fd, 0);
        if (err != 0 && err != EBADF && err != ENOENT) {
            ThrowCtl(err);
        }
    } else if (reg.Registered == 0) {
        err = Control(Fd_, EPOLL_CTL_ADD, fd, wanted);
        if (err == EEXIST) {
            err = Control(Fd_, EPOLL_CTL_MOD, fd, wanted);
        }
    } else {
        err = Control(Fd_, EPOLL_CTL_MOD, fd, wanted);
        if (err == ENOENT) {
            err = Control(Fd_, EPOLL_CTL_ADD, fd, wanted);
        }
    }
    if (wanted != 0 && err != 0) {
        ThrowCtl(err);
    }
    reg.Registered = wanted;
}

void TEPoll::Collect(const epoll_event& ev) {
    int fd = ev.data.fd;
    const auto& interest = Fds_[fd].Interest;
    bool broken = ev.events & (EPOLLHUP | EPOLLERR);

    if (interest.Read && ((ev.events & EPOLLIN) || broken)) {
        ReadyEvents_.push_back(TEvent{fd, TEvent::READ, interest.Read});
    }
    if (interest.Write && ((ev.events & EPOLLOUT) || broken)) {
        ReadyEvents_.push_back(TEvent{fd, TEvent::WRITE, interest.Write});
    }
}

void TEPoll::Poll() {
    auto timeout = GetTimeout();

    if (MaxFd_ >= static_cast<int>(Fds_.size())) {
        Fds_.resize(MaxFd_ + 1);
    }
    for (const auto& change : Changes_) {
        auto& reg = Fds_[change.Fd];
        reg.Interest.Apply(change);
        Sync(change.Fd, reg);
    }

    Reset();

    Ready_.resize(std::max<size_t>(1, Fds_.size()));
    int n = epoll_pwait2(Fd_, Ready_.data(), static_cast<int>(Ready_.size()), &timeout, nullptr);
    if (n < 0) {
        if (errno == EINTR) {
            return;
        }
        throw std::system_error(errno, std::generic_category(), "epoll_pwait2");
    }

    for (int i = 0; i < n; ++i) {
        Collect(Ready_[i]);
    }

    ProcessTimers();
}

} // namespace NOdin
