// Search driver: completion, cancellation, fatal errors, progress line
#include "format.hpp"
#include "keyfile.hpp"
#include "progress.hpp"
#include "result_sink.hpp"
#include "search.hpp"
#include "test_util.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace keygrind;

static std::string test_dir() {
    const char* dir = std::getenv("KEYGRIND_TEST_DIR");
    return dir ? dir : ".";
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Thread-safe sink keeping every record
class CollectingSink : public ResultSink {
public:
    void accept(const SearchTarget& target, const MatchRecord& record) override {
        (void)target;
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    std::vector<MatchRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<MatchRecord> records_;
};

// Deterministic keys: every 16th draw starts with 0x39, the rest with 0x00
class CountingSource : public CandidateSource {
public:
    bool next(Keypair& out) override {
        counter_++;
        out.public_key.fill(0x11);
        out.public_key[0] = (counter_ % 16 == 0) ? 0x39 : 0x00;
        out.public_key[31] = static_cast<uint8_t>(counter_);
        out.public_key[30] = static_cast<uint8_t>(counter_ >> 8);
        return true;
    }
    std::string error() const override { return ""; }

private:
    uint64_t counter_ = 0;
};

// Never matches anything
class BlankSource : public CandidateSource {
public:
    bool next(Keypair& out) override {
        out.public_key.fill(0x11);
        return true;
    }
    std::string error() const override { return ""; }
};

// Fails after a few draws
class FailingSource : public CandidateSource {
public:
    bool next(Keypair& out) override {
        if (++draws_ > 10) return false;
        out.public_key.fill(0x11);
        return true;
    }
    std::string error() const override { return "entropy source unavailable"; }

private:
    int draws_ = 0;
};

static Pattern prefix_pattern(const std::string& text) {
    Pattern pattern;
    std::string error;
    make_vanity_pattern(PatternKind::Prefix, text, 0, pattern, error);
    return pattern;
}

static Pattern suffix_pattern(const std::string& text) {
    Pattern pattern;
    std::string error;
    make_vanity_pattern(PatternKind::Suffix, text, 0, pattern, error);
    return pattern;
}

void test_completion() {
    test::section("Search completes with exact counts");

    std::vector<TargetRequest> requests(1);
    requests[0].pattern = prefix_pattern("z");
    requests[0].count = 5;

    SharedState state;
    CollectingSink sink;
    Coordinator coordinator(requests, sink, state);
    SourceFactory make_source = [] { return std::make_unique<CountingSource>(); };

    SearchResult result = run_search(coordinator, state, make_source, 4, nullptr);
    test::check(result.completed, "completed");
    test::check(!result.interrupted && !result.fatal, "no interruption or error");
    test::check(result.workers_started == 4, "4 workers started");
    test::check(sink.records().size() == 5, "exactly 5 records delivered");
    test::check(coordinator.found(0).size() == 5, "exactly 5 records kept");
    test::check(result.attempts >= 5 * 16, "attempts counted");
}

void test_cancellation() {
    test::section("Cancellation");

    std::vector<TargetRequest> requests(1);
    requests[0].pattern = prefix_pattern("z");
    requests[0].count = 1;

    SharedState state;
    CollectingSink sink;
    Coordinator coordinator(requests, sink, state);
    SourceFactory make_source = [] { return std::make_unique<BlankSource>(); };

    // Same effect as the signal handler
    std::thread canceller([&state] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        state.interrupted.store(true, std::memory_order_relaxed);
        state.stop.store(true, std::memory_order_release);
    });

    SearchResult result = run_search(coordinator, state, make_source, 2, nullptr);
    canceller.join();

    test::check(!result.completed, "not completed");
    test::check(result.interrupted, "interrupted");
    test::check(!result.fatal, "not fatal");
    test::check(result.attempts > 0, "attempts recorded before the stop");
    test::check(result.elapsed_seconds >= 0.15, "ran until cancelled");
    test::check(sink.records().empty(), "nothing delivered");
}

void test_fatal_source() {
    test::section("Fatal source error");

    std::vector<TargetRequest> requests(1);
    requests[0].pattern = prefix_pattern("z");
    requests[0].count = 1;

    SharedState state;
    CollectingSink sink;
    Coordinator coordinator(requests, sink, state);
    SourceFactory make_source = [] { return std::make_unique<FailingSource>(); };

    SearchResult result = run_search(coordinator, state, make_source, 3, nullptr);
    test::check(result.fatal, "fatal reported");
    test::check(!result.completed, "not completed");
    test::check(contains(result.error, "entropy source unavailable"), "error message carried: " + result.error);

    SharedState null_state;
    Coordinator null_coordinator(requests, sink, null_state);
    SourceFactory no_source = [] { return std::unique_ptr<CandidateSource>(); };
    SearchResult null_result = run_search(null_coordinator, null_state, no_source, 1, nullptr);
    test::check(null_result.fatal && contains(null_result.error, "no candidate source"), "missing source is fatal");
}

void test_batch_end_to_end() {
    test::section("Batch search with real keys");

    std::vector<TargetRequest> requests(2);
    requests[0].pattern = prefix_pattern("z");
    requests[0].count = 2;
    requests[1].pattern = suffix_pattern("Q");   // 0x17
    requests[1].count = 1;

    SharedState state;
    CollectingSink sink;
    Coordinator coordinator(requests, sink, state);
    SourceFactory make_source = [] { return std::make_unique<Ed25519Source>(); };

    SearchResult result = run_search(coordinator, state, make_source, 4, nullptr);
    test::check(result.completed && !result.fatal, "batch completed");

    std::vector<MatchRecord> records = sink.records();
    test::check(records.size() == 3, "exactly 3 records");

    bool all_match = true;
    size_t prefix_hits = 0, suffix_hits = 0;
    for (const MatchRecord& r : records) {
        const SearchTarget& target = coordinator.target(r.target_id);
        MatchInfo info;
        if (!check_match(r.keypair.public_key.data(), target.pattern, info)) all_match = false;

        Keypair check;
        std::string error;
        if (!keypair_from_secret(r.keypair.secret_key.data(), check, error)) all_match = false;

        if (r.target_id == 0) prefix_hits++;
        if (r.target_id == 1) suffix_hits++;
    }
    test::check(all_match, "every record is a valid keypair satisfying its pattern");
    test::check(prefix_hits == 2 && suffix_hits == 1, "2 prefix and 1 suffix record");
}

void test_progress_reporting() {
    test::section("Progress line");

    ProgressSnapshot snap;
    snap.attempts = 1234567;
    snap.rate = 250000;
    snap.found = 1;
    snap.requested = 3;
    snap.targets = 2;
    snap.targets_done = 1;
    snap.elapsed_seconds = 65;
    snap.eta_seconds = -1;

    std::string line = ProgressReporter::format_line(snap);
    test::check(contains(line, "1,234,567"), "attempts grouped");
    test::check(contains(line, "250,000/s"), "rate shown");
    test::check(contains(line, "Found: 1/3"), "found/requested shown");
    test::check(contains(line, "Targets: 1/2"), "targets shown for batches");
    test::check(contains(line, format_time(65)), "elapsed shown");
    test::check(contains(line, "calculating..."), "unknown ETA");

    snap.targets = 1;
    snap.eta_seconds = 30;
    line = ProgressReporter::format_line(snap);
    test::check(!contains(line, "Targets:"), "single target hides target count");
    test::check(contains(line, format_time(30)), "ETA shown once known");

    std::vector<TargetRequest> requests(1);
    requests[0].pattern = prefix_pattern("z");
    requests[0].count = 4;
    SharedState state;
    CollectingSink sink;
    Coordinator coordinator(requests, sink, state);

    std::ostringstream out;
    std::mutex console_mutex;
    ProgressReporter reporter(coordinator, state, out, console_mutex);
    state.attempts.store(1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ProgressSnapshot sampled = reporter.sample();
    test::check(sampled.attempts == 1000 && sampled.rate > 0, "sample sees attempts and rate");
    test::check(sampled.requested == 4 && sampled.found == 0, "sample sees target counts");
    test::check(sampled.eta_seconds > 0, "ETA estimated from the rate");

    reporter.tick();
    reporter.finish();
    test::check(out.str().front() == '\r' && out.str().back() == '\n', "tick rewrites the line, finish ends it");
}

void test_sink_during_search() {
    test::section("File sink inside a search");

    std::vector<TargetRequest> requests(1);
    requests[0].pattern = prefix_pattern("z");
    requests[0].count = 2;

    SharedState state;
    std::ostringstream out, err;
    std::mutex console_mutex;
    KeyFileSink sink(join_path(test_dir(), "does/not/exist"), out, err, console_mutex);
    Coordinator coordinator(requests, sink, state);
    SourceFactory make_source = [] { return std::make_unique<CountingSource>(); };

    SearchResult result = run_search(coordinator, state, make_source, 2, nullptr);
    test::check(result.completed, "search completes even when writes fail");
    test::check(sink.failed() == 2 && sink.written() == 0, "both write failures counted");
    test::check(coordinator.found(0).size() == 2, "matches kept in memory");
    test::check(contains(err.str(), "Warning:"), "warnings printed");
}

int main() {
    std::cout << "=== Search Tests ===" << std::endl;
    test_completion();
    test_cancellation();
    test_fatal_source();
    test_batch_end_to_end();
    test_progress_reporting();
    test_sink_during_search();
    return test::finish();
}
