#include "search.hpp"
#include "progress.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

namespace keygrind {

void SharedState::report_fatal(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!fatal.load(std::memory_order_relaxed)) {
            fatal_error = message;
            fatal.store(true, std::memory_order_release);
        }
    }
    stop.store(true, std::memory_order_release);
}

// ============================================================================
// Coordinator
// ============================================================================

Coordinator::Coordinator(const std::vector<TargetRequest>& requests, ResultSink& sink, SharedState& state)
    : sink_(sink), state_(state) {
    targets_.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); i++) {
        targets_.push_back(std::make_unique<SearchTarget>(i, requests[i].pattern, requests[i].count));
    }
    publish_active();
}

void Coordinator::publish_active() {
    std::lock_guard<std::mutex> lock(active_mutex_);

    auto next = std::make_shared<ActiveSet>();
    next->version = active_version_.load(std::memory_order_relaxed) + 1;
    for (const auto& target : targets_) {
        if (target->remaining.load(std::memory_order_acquire) > 0) {
            next->targets.push_back(target.get());
        }
    }

    active_ = std::move(next);
    active_version_.store(active_->version, std::memory_order_release);
}

std::shared_ptr<const ActiveSet> Coordinator::active_patterns() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_;
}

bool Coordinator::is_globally_done() const {
    for (const auto& target : targets_) {
        if (target->remaining.load(std::memory_order_acquire) > 0) {
            return false;
        }
    }
    return true;
}

size_t Coordinator::offer(const Keypair& keypair, const std::vector<TargetMatch>& matches, unsigned worker_id) {
    size_t accepted = 0;

    for (const TargetMatch& match : matches) {
        SearchTarget& target = *targets_[match.target_id];

        // Take one slot, never going below zero
        uint64_t current = target.remaining.load(std::memory_order_acquire);
        while (current > 0 &&
               !target.remaining.compare_exchange_weak(current, current - 1,
                       std::memory_order_acq_rel, std::memory_order_acquire)) {
        }

        if (current == 0) {
            // Another worker filled the last slot first
            target.discarded.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        MatchRecord record;
        record.target_id = target.id;
        record.keypair = keypair;
        record.info = match.info;
        record.sequence = target.requested - current + 1;
        record.worker_id = worker_id;

        {
            // Kept in slot order even when a later slot gets here first
            std::lock_guard<std::mutex> lock(target.found_mutex);
            auto pos = std::upper_bound(target.found.begin(), target.found.end(), record.sequence,
                                        [](uint64_t sequence, const MatchRecord& r) { return sequence < r.sequence; });
            target.found.insert(pos, record);
        }
        sink_.accept(target, record);
        accepted++;

        if (current == 1) {
            publish_active();
            if (is_globally_done()) {
                state_.stop.store(true, std::memory_order_release);
            }
        }
    }

    return accepted;
}

std::vector<MatchRecord> Coordinator::found(size_t id) const {
    const SearchTarget& t = *targets_[id];
    std::lock_guard<std::mutex> lock(t.found_mutex);
    return t.found;
}

uint64_t Coordinator::total_requested() const {
    uint64_t total = 0;
    for (const auto& target : targets_) {
        total += target->requested;
    }
    return total;
}

uint64_t Coordinator::total_found() const {
    uint64_t total = 0;
    for (const auto& target : targets_) {
        total += target->requested - target->remaining.load(std::memory_order_relaxed);
    }
    return total;
}

// ============================================================================
// Workers
// ============================================================================

__attribute__((hot))
void worker_loop(unsigned worker_id, const SourceFactory& make_source,
                 Coordinator& coordinator, SharedState& state) {
    std::unique_ptr<CandidateSource> source = make_source();
    if (!source) {
        state.report_fatal("worker " + std::to_string(worker_id) + ": no candidate source");
        return;
    }

    std::shared_ptr<const ActiveSet> active = coordinator.active_patterns();
    std::vector<TargetMatch> matches;
    matches.reserve(coordinator.target_count());

    Keypair candidate;
    uint64_t local_count = 0;
    constexpr uint64_t BATCH_SIZE = 256;

    while (!state.stop.load(std::memory_order_relaxed)) {
        if (coordinator.active_version() != active->version) {
            active = coordinator.active_patterns();
        }

        if (!source->next(candidate)) {
            state.report_fatal("worker " + std::to_string(worker_id) + ": " + source->error());
            break;
        }

        // One draw is tested against every unsatisfied target
        matches.clear();
        for (const SearchTarget* target : active->targets) {
            MatchInfo info;
            if (check_match(candidate.public_key.data(), target->pattern, info)) {
                matches.push_back(TargetMatch{target->id, info});
            }
        }
        if (!matches.empty()) {
            coordinator.offer(candidate, matches, worker_id);
        }

        // Batch progress updates to reduce atomic contention
        if (++local_count % BATCH_SIZE == 0) {
            state.attempts.fetch_add(BATCH_SIZE, std::memory_order_relaxed);
        }
    }

    // Add remaining count
    uint64_t remaining = local_count % BATCH_SIZE;
    if (remaining > 0) {
        state.attempts.fetch_add(remaining, std::memory_order_relaxed);
    }
}

SearchResult run_search(Coordinator& coordinator, SharedState& state, const SourceFactory& make_source,
                        unsigned num_workers, ProgressReporter* reporter) {
    SearchResult result;

    if (coordinator.is_globally_done()) {
        state.stop.store(true, std::memory_order_release);
    }

    // Spawn worker threads
    std::vector<std::thread> workers;
    workers.reserve(num_workers);

    for (unsigned int i = 0; i < num_workers && !state.stop.load(std::memory_order_relaxed); i++) {
        try {
            workers.emplace_back(worker_loop, i, std::cref(make_source), std::ref(coordinator), std::ref(state));
        } catch (const std::system_error& e) {
            state.report_fatal(std::string("cannot start worker thread: ") + e.what());
        }
    }
    result.workers_started = static_cast<unsigned>(workers.size());

    // Progress monitoring loop
    constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);
    constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(500);
    auto last_report = state.start_time;

    while (!state.stop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(POLL_INTERVAL);

        auto now = std::chrono::steady_clock::now();
        if (reporter && now - last_report >= PROGRESS_INTERVAL) {
            reporter->tick();
            last_report = now;
        }
    }

    // Wait for all workers to finish
    for (auto& worker : workers) {
        worker.join();
    }

    if (reporter) {
        reporter->finish();
    }

    auto end_time = std::chrono::steady_clock::now();
    result.elapsed_seconds = std::chrono::duration<double>(end_time - state.start_time).count();
    result.attempts = state.attempts.load(std::memory_order_relaxed);
    result.completed = coordinator.is_globally_done();
    result.interrupted = state.interrupted.load(std::memory_order_relaxed);
    result.fatal = state.fatal.load(std::memory_order_acquire);
    if (result.fatal) {
        std::lock_guard<std::mutex> lock(state.error_mutex);
        result.error = state.fatal_error;
    }
    return result;
}

} // namespace keygrind
