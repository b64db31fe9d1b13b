// Match frequencies over uniformly random keys against the estimates
#include "pattern.hpp"
#include "test_util.hpp"

#include <cmath>
#include <cstring>
#include <random>

using namespace keygrind;

static void random_key(std::mt19937_64& rng, uint8_t* key) {
    for (int i = 0; i < 4; i++) {
        uint64_t word = rng();
        std::memcpy(key + i * 8, &word, 8);
    }
}

// Observed hit rate of a pattern over n random keys
static double hit_rate(const Pattern& pattern, uint64_t n, uint64_t seed) {
    std::mt19937_64 rng(seed);
    uint8_t key[32];
    uint64_t hits = 0;
    for (uint64_t i = 0; i < n; i++) {
        random_key(rng, key);
        MatchInfo info;
        if (check_match(key, pattern, info)) hits++;
    }
    return static_cast<double>(hits) / static_cast<double>(n);
}

static bool within(double observed, double expected, double tolerance) {
    return std::fabs(observed - expected) <= expected * tolerance;
}

void test_single_byte_prefix() {
    test::section("One-byte prefix");

    Pattern pattern;
    std::string error;
    make_vanity_pattern(PatternKind::Prefix, "z", 0, pattern, error);   // 0x39
    test::check(pattern.bytes.size() == 1 && pattern.bytes[0] == 0x39, "\"z\" decodes to 0x39");

    double rate = hit_rate(pattern, 2000000, 0x5eed0001);
    std::cout << "  observed 1/" << 1.0 / rate << std::endl;
    test::check(within(rate, 1.0 / 256, 0.05), "prefix rate within 5% of 1/256");
    test::check(within(1.0 / rate, estimate_attempts(pattern), 0.05), "estimate agrees with observation");
}

void test_single_byte_at() {
    test::section("One-byte at offset");

    Pattern pattern;
    std::string error;
    make_vanity_pattern(PatternKind::At, "z", 17, pattern, error);
    double rate = hit_rate(pattern, 2000000, 0x5eed0002);
    test::check(within(rate, 1.0 / 256, 0.05), "at:17 rate within 5% of 1/256");
}

void test_single_byte_contains() {
    test::section("One-byte contains");

    // P(byte appears somewhere in 32) = 1 - (255/256)^32
    Pattern pattern;
    std::string error;
    make_vanity_pattern(PatternKind::Contains, "z", 0, pattern, error);
    double rate = hit_rate(pattern, 500000, 0x5eed0003);
    double expected = 1.0 - std::pow(255.0 / 256.0, 32);
    test::check(within(rate, expected, 0.03), "contains rate within 3% of 1-(255/256)^32");
}

void test_immediate_rate() {
    test::section("Immediate segments");

    // Each segment qualifies with probability 2^-32; a few million random
    // keys should essentially never produce one
    Pattern pattern = make_immediate_pattern();
    double rate = hit_rate(pattern, 1000000, 0x5eed0004);
    test::check(rate == 0.0, "no imm32 hit in 1M random keys");
    test::check(estimate_attempts(pattern) == std::ldexp(1.0, 30), "estimate is 2^32 / 4");
}

int main() {
    std::cout << "=== Calibration Tests ===" << std::endl;
    test_single_byte_prefix();
    test_single_byte_at();
    test_single_byte_contains();
    test_immediate_rate();
    return test::finish();
}
