#include "signal_handler.h"

CancelToken g_cancel;

void signal_handler(int signum) {
    if (signum == SIGINT) {
        // Only async-signal-safe work here; the miner reports the abort
        g_cancel.request();
    }
}
