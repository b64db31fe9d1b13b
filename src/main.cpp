/**
 * keygrind - multi-threaded Ed25519 key grinder
 *
 * Searches random Ed25519 keypairs for public keys with special structure:
 *   - 32-bit immediate segments: an 8-byte segment of the key that a
 *     sign-extended 32-bit immediate can encode
 *   - vanity byte patterns decoded from base58 (prefix, suffix, contains, at)
 *
 * Several targets can share one worker pool (batch mode); every generated key
 * is tested against all targets that still need matches.
 */

#include "asm_format.hpp"
#include "format.hpp"
#include "keyfile.hpp"
#include "pattern.hpp"
#include "progress.hpp"
#include "result_sink.hpp"
#include "search.hpp"

#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace keygrind;

// Global state for signal handling
static SharedState* g_state = nullptr;

void signal_handler(int) {
    if (g_state) {
        g_state->interrupted.store(true, std::memory_order_relaxed);
        g_state->stop.store(true, std::memory_order_release);
    }
}

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [OPTIONS] COMMAND [ARGS]\n\n"
              << "Grind Ed25519 keypairs until the public key matches a pattern.\n\n"
              << "Commands:\n"
              << "  grind [count]                    Find keys with a 32-bit immediate segment (default: 1)\n"
              << "  vanity <pattern>[:count]         Find keys starting with the decoded pattern bytes\n"
              << "  vanity <type>:<pattern>[:count]  type is prefix, suffix or contains\n"
              << "  vanity at:<offset>:<pattern>[:count]\n"
              << "                                   Match the pattern bytes at a byte offset\n"
              << "  batch <spec> [spec...]           Search several targets with one worker pool;\n"
              << "                                   spec uses the vanity syntax or IMM[:count]\n"
              << "  address <keypair.json>           Print a keypair as assembly constants\n\n"
              << "Options:\n"
              << "  -w, --workers N     Number of worker threads (default: CPU cores)\n"
              << "  -o, --output DIR    Directory for keypair files (default: .)\n"
              << "  -q, --quiet         Do not print the progress line\n"
              << "  -h, --help          Show this help message\n\n"
              << "Immediate pattern (checked on bytes 0-7, 8-15, 16-23, 24-31):\n"
              << "  - If bit 31 clear: bytes 4-7 of the segment must be 0x00 (positive i32)\n"
              << "  - If bit 31 set:   bytes 4-7 of the segment must be 0xFF (negative i32)\n\n"
              << "Vanity patterns use the base58 alphabet and are matched as raw key bytes.\n\n"
              << "Examples:\n"
              << "  " << prog_name << " grind 5                  # Find 5 immediate-compatible keys\n"
              << "  " << prog_name << " vanity abc                # Key bytes start with decode(\"abc\")\n"
              << "  " << prog_name << " vanity suffix:zz:3        # 3 keys ending with decode(\"zz\")\n"
              << "  " << prog_name << " vanity at:8:Q             # decode(\"Q\") at byte 8\n"
              << "  " << prog_name << " batch IMM:2 ab:1 contains:xyz\n"
              << "  " << prog_name << " address key.json          # Assembly constants for key.json\n";
}

static int run_address(const std::string& path) {
    Keypair keypair;
    std::string error;
    if (!load_keypair(path, keypair, error)) {
        std::cerr << "Error converting keypair: " << error << "\n";
        return 1;
    }
    std::cout << render_address_report(keypair);
    return 0;
}

static int run_targets(const std::string& mode, const std::vector<TargetRequest>& requests,
                       unsigned num_workers, const std::string& output_dir, bool quiet) {
    std::cout << "Ed25519 Key Grinder - " << mode << "\n";
    std::cout << "=====================================\n";
    for (size_t i = 0; i < requests.size(); i++) {
        std::cout << "Target " << std::setw(3) << i + 1 << ":       "
                  << std::left << std::setw(24) << pattern_label(requests[i].pattern) << std::right
                  << " x" << requests[i].count
                  << "  (~" << format_estimate(estimate_attempts(requests[i].pattern))
                  << " tries each)\n";
    }
    std::cout << "Workers:          " << num_workers << "\n";
    std::cout << "Output:           " << output_dir << "\n";
    std::cout << "=====================================\n\n";
    std::cout << "Searching... (Ctrl+C to cancel)\n\n";

    // Set up shared state
    SharedState state;
    g_state = &state;
    std::mutex console_mutex;

    KeyFileSink sink(output_dir, std::cout, std::cerr, console_mutex);
    Coordinator coordinator(requests, sink, state);
    ProgressReporter reporter(coordinator, state, std::cout, console_mutex);

    // Set up signal handler for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SourceFactory make_source = [] { return std::make_unique<Ed25519Source>(); };
    SearchResult result = run_search(coordinator, state, make_source, num_workers, quiet ? nullptr : &reporter);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_state = nullptr;

    std::cout << "\n------- Summary -------\n";
    for (size_t i = 0; i < coordinator.target_count(); i++) {
        const SearchTarget& target = coordinator.target(i);
        uint64_t found = target.requested - target.remaining.load();
        std::cout << "  " << std::left << std::setw(24) << pattern_label(target.pattern) << std::right
                  << " " << found << "/" << target.requested;
        uint64_t discarded = target.discarded.load();
        if (discarded > 0) {
            std::cout << "  (" << discarded << " late match" << (discarded == 1 ? "" : "es") << " discarded)";
        }
        std::cout << "\n";
    }
    std::cout << "Keys found: " << coordinator.total_found() << "/" << coordinator.total_requested() << "\n";
    std::cout << "Total attempts: " << format_number(result.attempts) << "\n";
    std::cout << "Time elapsed: " << format_time(result.elapsed_seconds) << "\n";
    if (result.elapsed_seconds > 0) {
        std::cout << "Average rate: "
                  << format_number(static_cast<uint64_t>(result.attempts / result.elapsed_seconds))
                  << " keys/sec\n";
    }
    if (sink.failed() > 0) {
        std::cout << "Write failures: " << sink.failed() << "\n";
    }

    if (result.fatal) {
        std::cerr << "Error: " << result.error << "\n";
        return 2;
    }
    if (sink.written() == 0 && sink.failed() > 0) {
        std::cerr << "Error: no keypair could be written to " << output_dir << "\n";
        return 2;
    }
    if (!result.completed) {
        std::cout << "Search cancelled after " << format_number(result.attempts)
                  << " attempts (" << format_time(result.elapsed_seconds) << ")\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Default values
    unsigned int num_workers = std::thread::hardware_concurrency();
    std::string output_dir = ".";
    bool quiet = false;
    std::vector<std::string> positional;

    if (num_workers == 0) num_workers = 4;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-w" || arg == "--workers") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --workers requires an argument\n";
                return 1;
            }
            uint64_t workers = 0;
            std::string error;
            if (!parse_count(argv[++i], workers, error) || workers > 4096) {
                std::cerr << "Error: workers must be between 1 and 4096\n";
                return 1;
            }
            num_workers = static_cast<unsigned int>(workers);
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --output requires an argument\n";
                return 1;
            }
            output_dir = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = positional[0];
    const std::vector<std::string> args(positional.begin() + 1, positional.end());
    std::vector<TargetRequest> requests;
    std::string error;

    if (command == "address") {
        if (args.size() != 1) {
            std::cerr << "Error: address command requires a keypair file\n";
            std::cerr << "Usage: " << argv[0] << " address <keypair.json>\n";
            return 1;
        }
        return run_address(args[0]);
    }

    if (command == "grind") {
        if (args.size() > 1) {
            std::cerr << "Error: grind takes at most one count\n";
            return 1;
        }
        TargetRequest request;
        request.pattern = make_immediate_pattern();
        if (args.size() == 1 && !parse_count(args[0], request.count, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        requests.push_back(request);
        return run_targets("32-bit immediate segments", requests, num_workers, output_dir, quiet);
    }

    if (command == "vanity") {
        if (args.size() != 1) {
            std::cerr << "Error: vanity command requires exactly one pattern\n";
            std::cerr << "Usage: " << argv[0] << " vanity [prefix|suffix|contains:]<pattern>[:count]\n";
            return 1;
        }
        TargetRequest request;
        if (!parse_target_spec(args[0], false, request.pattern, request.count, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        requests.push_back(request);
        return run_targets("vanity", requests, num_workers, output_dir, quiet);
    }

    if (command == "batch") {
        if (args.empty()) {
            std::cerr << "Error: batch command requires at least one pattern\n";
            std::cerr << "Usage: " << argv[0] << " batch <pattern:count> [pattern:count ...]\n";
            return 1;
        }
        for (const std::string& spec : args) {
            TargetRequest request;
            if (!parse_target_spec(spec, true, request.pattern, request.count, error)) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
            requests.push_back(request);
        }
        return run_targets("batch (" + std::to_string(requests.size()) + " targets)",
                           requests, num_workers, output_dir, quiet);
    }

    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    print_usage(argv[0]);
    return 1;
}
