#pragma once

#include "search.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace keygrind {

// One sample of the advisory counters
struct ProgressSnapshot {
    uint64_t attempts = 0;
    double rate = 0;             // keys/second since the previous sample
    uint64_t found = 0;
    uint64_t requested = 0;
    size_t targets_done = 0;
    size_t targets = 0;
    double elapsed_seconds = 0;
    double eta_seconds = -1;     // < 0 while unknown
};

/**
 * Periodic status line. Reads only relaxed atomics, so sampling never
 * slows the workers down.
 */
class ProgressReporter {
public:
    ProgressReporter(const Coordinator& coordinator, const SharedState& state,
                     std::ostream& out, std::mutex& console_mutex);

    /**
     * Sample counters; the rate covers the interval since the last sample
     */
    ProgressSnapshot sample();

    /**
     * Sample and print one carriage-return status line
     */
    void tick();

    /**
     * Terminate the status line once the search is over
     */
    void finish();

    static std::string format_line(const ProgressSnapshot& snapshot);

private:
    const Coordinator& coordinator_;
    const SharedState& state_;
    std::ostream& out_;
    std::mutex& console_mutex_;

    uint64_t last_attempts_ = 0;
    std::chrono::steady_clock::time_point last_time_;
    bool printed_ = false;
};

} // namespace keygrind
