#pragma once

#include "keypair.hpp"
#include "pattern.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace keygrind {

// Accepted match, immutable once built
struct MatchRecord {
    size_t target_id = 0;
    Keypair keypair;
    MatchInfo info;
    uint64_t sequence = 0;     // 1-based slot within the target (n of requested)
    unsigned worker_id = 0;
};

// One requested search goal
struct TargetRequest {
    Pattern pattern;
    uint64_t count = 1;
};

/**
 * Outstanding search goal shared by all workers.
 * remaining only ever decreases; the target is satisfied at zero.
 */
struct SearchTarget {
    SearchTarget(size_t target_id, Pattern target_pattern, uint64_t count)
        : id(target_id), pattern(std::move(target_pattern)), requested(count), remaining(count) {}

    // Non-copyable
    SearchTarget(const SearchTarget&) = delete;
    SearchTarget& operator=(const SearchTarget&) = delete;

    const size_t id;
    const Pattern pattern;
    const uint64_t requested;
    std::atomic<uint64_t> remaining;
    std::atomic<uint64_t> discarded{0};     // late matches lost the race for the last slot

    std::vector<MatchRecord> found;         // ordered by sequence (slot order)
    mutable std::mutex found_mutex;
};

// Shared state between main thread and workers
struct SharedState {
    std::atomic<bool> stop{false};            // global stop: all targets satisfied, signal, or fatal error
    std::atomic<bool> interrupted{false};     // stop came from SIGINT/SIGTERM
    std::atomic<bool> fatal{false};
    std::atomic<uint64_t> attempts{0};        // advisory, relaxed
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    std::string fatal_error;                  // first fatal error, guarded by error_mutex
    std::mutex error_mutex;

    /**
     * Record a fatal error (first one wins) and stop the search
     */
    void report_fatal(const std::string& message);
};

/**
 * Receives every accepted match, possibly from several workers at once.
 * Implementations must be thread-safe and must not throw.
 */
class ResultSink {
public:
    virtual ~ResultSink() = default;
    virtual void accept(const SearchTarget& target, const MatchRecord& record) = 0;
};

// Versioned list of targets that still need matches
struct ActiveSet {
    uint64_t version = 0;
    std::vector<const SearchTarget*> targets;
};

// Candidate hit reported by a worker
struct TargetMatch {
    size_t target_id;
    MatchInfo info;
};

/**
 * Target registry and batch coordinator
 *
 * Every target shares one candidate stream: a worker tests each generated
 * key against the whole active set, then offers its hits here. Acceptance
 * is a compare-and-decrement on the target's remaining count, so no target
 * ever accepts more than it requested.
 */
class Coordinator {
public:
    Coordinator(const std::vector<TargetRequest>& requests, ResultSink& sink, SharedState& state);

    // Non-copyable
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /**
     * Offer a candidate that matched one or more targets
     *
     * For each hit, takes a slot if the target still has one, records the
     * match and forwards it to the sink. Hits on satisfied targets are
     * discarded. Raises the global stop once every target is satisfied.
     *
     * @return Number of accepted matches
     */
    size_t offer(const Keypair& keypair, const std::vector<TargetMatch>& matches, unsigned worker_id);

    /**
     * True iff every target's remaining count is zero
     */
    bool is_globally_done() const;

    /**
     * Current snapshot of unsatisfied targets
     */
    std::shared_ptr<const ActiveSet> active_patterns() const;

    /**
     * Version of the current snapshot; workers re-fetch when it changes
     */
    uint64_t active_version() const { return active_version_.load(std::memory_order_acquire); }

    size_t target_count() const { return targets_.size(); }
    const SearchTarget& target(size_t id) const { return *targets_[id]; }

    /**
     * Copy of a target's accepted matches
     */
    std::vector<MatchRecord> found(size_t id) const;

    uint64_t total_requested() const;
    uint64_t total_found() const;

private:
    void publish_active();

    std::vector<std::unique_ptr<SearchTarget>> targets_;
    ResultSink& sink_;
    SharedState& state_;

    std::shared_ptr<const ActiveSet> active_;
    mutable std::mutex active_mutex_;
    std::atomic<uint64_t> active_version_{0};
};

// Creates one candidate source per worker thread
using SourceFactory = std::function<std::unique_ptr<CandidateSource>()>;

class ProgressReporter;

// Outcome of run_search
struct SearchResult {
    bool completed = false;      // every target satisfied
    bool interrupted = false;
    bool fatal = false;
    std::string error;
    uint64_t attempts = 0;
    double elapsed_seconds = 0;
    unsigned workers_started = 0;
};

/**
 * Worker thread function - draws candidates and checks them against the
 * active targets until the global stop is raised
 */
void worker_loop(unsigned worker_id, const SourceFactory& make_source,
                 Coordinator& coordinator, SharedState& state);

/**
 * Start num_workers workers, run the progress loop on the calling thread
 * until the global stop, then join everything
 *
 * @param reporter Optional progress reporter, ticked every 500ms
 */
SearchResult run_search(Coordinator& coordinator, SharedState& state, const SourceFactory& make_source,
                        unsigned num_workers, ProgressReporter* reporter);

} // namespace keygrind
