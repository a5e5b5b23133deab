#pragma once

#include "poller.hpp"

namespace NOdin {

/**
 * @class TLoop
 * @brief Owns the poller. One Step() is one Poll() followed by resuming
 * every coroutine whose descriptor became ready.
 *
 * The owner decides when to stop; usually that is
 * TActorSystem::ProcessRequests(), which steps until shutdown completes.
 */
template<typename TPoller>
class TLoop {
public:
    void Step() {
        Poller_.Poll();
        Poller_.WakeupReadyHandles();
    }

    TPoller& Poller() {
        return Poller_;
    }

private:
    TPoller Poller_;
};

} // namespace NOdin
