#pragma once

namespace platform {

// Detaches from the controlling terminal. Returns only in the daemon process.
void daemonize();

} // namespace platform
