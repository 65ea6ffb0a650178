#ifndef CANCEL_TOKEN_H
#define CANCEL_TOKEN_H

#include <atomic>

// Cooperative interrupt flag. Set from anywhere (a signal handler included),
// polled by the search at its checkpoints.
class CancelToken {
public:
    void request() { stop_requested.store(true, std::memory_order_relaxed); }
    bool requested() const { return stop_requested.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> stop_requested{false};
};

#endif // CANCEL_TOKEN_H
