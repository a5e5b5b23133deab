#pragma once

namespace NOdin {

/**
 * @brief Process-wide setup for socket I/O.
 *
 * Ignores SIGPIPE so that writes to a closed peer fail with EPIPE instead
 * of killing the process. Create one before the first socket.
 */
struct TInitializer {
    TInitializer();
};

} // namespace NOdin
