#pragma once

#include <poll.h>

#include "base.hpp"
#include "poller.hpp"
#include "socket.hpp"

namespace NOdin {

/// ppoll() backend. Selected with "system.poller": "poll".
class TPoll: public TPollerBase {
public:
    using TSocket = NOdin::TSocket;
    using TFileHandle = NOdin::TFileHandle;

    void Poll();

private:
    struct TSlot {
        TInterest Interest;
        int Index = -1; // position in Fds_, -1 when not watched
    };

    void Update(int fd, TSlot& slot);

    std::vector<TSlot> Slots_;
    std::vector<pollfd> Fds_;
};

} // namespace NOdin
