#pragma once

#include "search.hpp"

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>

namespace keygrind {

/**
 * Prints each accepted match and saves it as a JSON keypair file.
 * A failed write is reported as a warning; the search goes on and the
 * match stays on screen and in memory.
 */
class KeyFileSink : public ResultSink {
public:
    KeyFileSink(std::string output_dir, std::ostream& out, std::ostream& err, std::mutex& console_mutex);

    void accept(const SearchTarget& target, const MatchRecord& record) override;

    uint64_t written() const { return written_.load(std::memory_order_relaxed); }
    uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }

    /**
     * Human readable description of a match, as printed by accept()
     */
    static std::string describe(const SearchTarget& target, const MatchRecord& record);

private:
    std::string output_dir_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex& console_mutex_;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace keygrind
