#include "init.hpp"

#include <signal.h>

#include <stdexcept>

namespace NOdin {

TInitializer::TInitializer() {
    if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        throw std::runtime_error("cannot ignore SIGPIPE");
    }
}

} // namespace NOdin
