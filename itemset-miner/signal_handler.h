#ifndef SIGNAL_HANDLER_H
#define SIGNAL_HANDLER_H

#include <csignal>
#include "cancel_token.h"

// Process-wide token for the command line front end; the library itself
// only sees the pointer it is handed.
extern CancelToken g_cancel;

void signal_handler(int signum);

#endif // SIGNAL_HANDLER_H
