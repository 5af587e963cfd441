#pragma once

namespace drive_bridge {

    // Blocks until SIGINT or SIGTERM is delivered
    void wait_for_shutdown_signal();

}
