#ifndef TIMER_H
#define TIMER_H

#include <chrono>
#include <string>
#include <iostream>

using TimePoint = std::chrono::steady_clock::time_point;

inline TimePoint start_timer() {
    return std::chrono::steady_clock::now();
}

inline double elapsed_seconds(TimePoint start) {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count();
}

// Library code passes its verbose flag; the CLI always logs.
inline void stop_timer(const std::string& label, TimePoint start, bool verbose = true) {
    if (!verbose) return;
    std::cout << "[TIMER] " << label << ": " << elapsed_seconds(start) << " seconds" << std::endl;
}

#endif // TIMER_H
