#include "progress.hpp"
#include "format.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace keygrind {

ProgressReporter::ProgressReporter(const Coordinator& coordinator, const SharedState& state,
                                   std::ostream& out, std::mutex& console_mutex)
    : coordinator_(coordinator), state_(state), out_(out), console_mutex_(console_mutex),
      last_time_(state.start_time) {}

ProgressSnapshot ProgressReporter::sample() {
    ProgressSnapshot snap;
    auto now = std::chrono::steady_clock::now();

    snap.attempts = state_.attempts.load(std::memory_order_relaxed);
    snap.elapsed_seconds = std::chrono::duration<double>(now - state_.start_time).count();

    double elapsed_interval = std::chrono::duration<double>(now - last_time_).count();
    uint64_t delta = snap.attempts >= last_attempts_ ? snap.attempts - last_attempts_ : 0;
    snap.rate = (elapsed_interval > 0) ? delta / elapsed_interval : 0;

    // Targets share every draw, so the slowest one bounds the ETA
    double eta_attempts = 0;
    snap.targets = coordinator_.target_count();
    for (size_t i = 0; i < snap.targets; i++) {
        const SearchTarget& target = coordinator_.target(i);
        uint64_t remaining = target.remaining.load(std::memory_order_relaxed);
        snap.requested += target.requested;
        snap.found += target.requested - remaining;
        if (remaining == 0) {
            snap.targets_done++;
        } else {
            eta_attempts = std::max(eta_attempts, remaining * estimate_attempts(target.pattern));
        }
    }
    if (snap.rate > 0) {
        snap.eta_seconds = eta_attempts / snap.rate;
    }

    last_attempts_ = snap.attempts;
    last_time_ = now;
    return snap;
}

std::string ProgressReporter::format_line(const ProgressSnapshot& snapshot) {
    std::ostringstream line;
    line << "Attempts: " << std::setw(12) << format_number(snapshot.attempts)
         << " | Rate: " << std::setw(8) << format_number(static_cast<uint64_t>(snapshot.rate)) << "/s"
         << " | Found: " << snapshot.found << "/" << snapshot.requested;
    if (snapshot.targets > 1) {
        line << " | Targets: " << snapshot.targets_done << "/" << snapshot.targets;
    }
    line << " | Elapsed: " << std::setw(8) << format_time(snapshot.elapsed_seconds)
         << " | ETA: " << std::setw(10)
         << (snapshot.eta_seconds < 0 ? std::string("calculating...") : format_time(snapshot.eta_seconds));
    return line.str();
}

void ProgressReporter::tick() {
    std::string line = format_line(sample());
    std::lock_guard<std::mutex> lock(console_mutex_);
    out_ << "\r" << line << "   " << std::flush;
    printed_ = true;
}

void ProgressReporter::finish() {
    std::lock_guard<std::mutex> lock(console_mutex_);
    if (printed_) {
        out_ << "\n" << std::flush;
        printed_ = false;
    }
}

} // namespace keygrind
