#pragma once

namespace platform {

// Detach from the controlling terminal (double fork, stdio to /dev/null).
void daemonize();

} // namespace platform
