#pragma once

#include "init.hpp"
#include "address.hpp"
#include "poller.hpp"
#include "poll.hpp"
#include "epoll.hpp"
#include "loop.hpp"
#include "promises.hpp"
#include "socket.hpp"
#include "corochain.hpp"
#include "sockutils.hpp"
#include "ssl.hpp"
#include "ws.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace NOdin {

using TDefaultPoller = TEPoll;

} // namespace NOdin
