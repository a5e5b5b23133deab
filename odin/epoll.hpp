#pragma once

#include <sys/epoll.h>

#include "base.hpp"
#include "poller.hpp"
#include "socket.hpp"

namespace NOdin {

/**
 * @class TEPoll
 * @brief Linux epoll backend, the default poller.
 *
 * Keeps, per descriptor, the waiting coroutines and the event mask the
 * kernel currently has. Before each wait the pending changes are folded
 * in and only descriptors whose mask moved cost an epoll_ctl call.
 */
class TEPoll: public TPollerBase {
public:
    using TSocket = NOdin::TSocket;
    using TFileHandle = NOdin::TFileHandle;

    TEPoll();
    ~TEPoll();

    void Poll();

private:
    struct TRegistration {
        TInterest Interest;
        int Registered = 0;
    };

    void Sync(int fd, TRegistration& reg);
    void Collect(const epoll_event& ev);

    int Fd_;
    std::vector<TRegistration> Fds_;
    std::vector<epoll_event> Ready_;
};

} // namespace NOdin
