#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keygrind {

constexpr int NUM_SEGMENTS = 4;
constexpr size_t SEGMENT_LEN = 8;

// Predicate family of a search target
enum class PatternKind {
    ImmediateSegment,   // any 8-byte segment is a sign-extended 32-bit immediate
    Prefix,
    Suffix,
    Contains,
    At
};

/**
 * Search predicate. Vanity bytes are decoded from base58 once, at
 * construction; check_match never allocates.
 */
struct Pattern {
    PatternKind kind = PatternKind::ImmediateSegment;
    std::string text;             // Pattern as typed (base58), empty for ImmediateSegment
    std::vector<uint8_t> bytes;   // Decoded literal bytes
    size_t offset = 0;            // Byte offset, At only
};

// Where a pattern matched
struct MatchInfo {
    int segment = -1;    // ImmediateSegment: first matching segment (0-3)
    size_t offset = 0;   // Byte offset of the matched window
};

/**
 * Pattern matching any sign-extension compatible segment
 */
Pattern make_immediate_pattern();

/**
 * Build and validate a vanity pattern
 *
 * Rejects empty text, characters outside the base58 alphabet, decoded
 * length above 32 bytes, and (for At) offset + length above 32.
 *
 * @param kind Prefix, Suffix, Contains or At
 * @param text base58 pattern text
 * @param offset Byte offset (At only)
 * @param out Receives the pattern
 * @param error Receives the reason on failure
 */
bool make_vanity_pattern(PatternKind kind, const std::string& text, size_t offset,
                         Pattern& out, std::string& error);

/**
 * Check a 32-byte public key against a pattern
 */
bool check_match(const uint8_t* key, const Pattern& pattern, MatchInfo& info);

/**
 * True if segment i of key (bytes 8i..8i+7) holds a little-endian i32
 * whose sign extension reproduces the whole 8-byte segment
 */
bool is_imm32_segment(const uint8_t* key, int segment);

/**
 * Index of the first compatible segment, scanning 0..3, or -1
 */
int find_imm32_segment(const uint8_t* key);

// Little-endian views of one segment
int32_t segment_i32(const uint8_t* key, int segment);
uint64_t segment_u64(const uint8_t* key, int segment);

/**
 * Short display label: "imm32", "prefix:abc", "at:4:abc"
 */
std::string pattern_label(const Pattern& pattern);

const char* kind_to_string(PatternKind kind);

/**
 * Expected number of uniformly random keys needed for one match
 */
double estimate_attempts(const Pattern& pattern);

/**
 * Parse a positive decimal count
 */
bool parse_count(const std::string& text, uint64_t& count, std::string& error);

/**
 * Parse one command-line target specification
 *
 *   <pattern>[:count]                          prefix match
 *   prefix|suffix|contains:<pattern>[:count]
 *   at:<offset>:<pattern>[:count]
 *   IMM[:count]                                only when allow_immediate
 *
 * Count defaults to 1.
 */
bool parse_target_spec(const std::string& spec, bool allow_immediate,
                       Pattern& pattern, uint64_t& count, std::string& error);

} // namespace keygrind
