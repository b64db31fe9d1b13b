#include "pattern.hpp"
#include "base58.hpp"
#include "keypair.hpp"

#include <cmath>
#include <cstring>
#include <sstream>

namespace keygrind {

Pattern make_immediate_pattern() {
    Pattern pattern;
    pattern.kind = PatternKind::ImmediateSegment;
    return pattern;
}

bool make_vanity_pattern(PatternKind kind, const std::string& text, size_t offset,
                         Pattern& out, std::string& error) {
    if (kind == PatternKind::ImmediateSegment) {
        error = "immediate-segment patterns take no text";
        return false;
    }
    if (text.empty()) {
        error = "pattern is empty";
        return false;
    }
    if (!is_base58(text)) {
        error = "pattern \"" + text + "\" contains characters outside the base58 alphabet "
                "(0, O, I and l are not allowed)";
        return false;
    }

    std::vector<uint8_t> bytes;
    if (!base58_decode(text, bytes)) {
        error = "cannot decode pattern \"" + text + "\"";
        return false;
    }
    if (bytes.empty()) {
        error = "pattern \"" + text + "\" decodes to zero bytes";
        return false;
    }
    if (bytes.size() > PUBLIC_KEY_LEN) {
        error = "pattern \"" + text + "\" decodes to " + std::to_string(bytes.size()) +
                " bytes (maximum 32)";
        return false;
    }
    if (kind == PatternKind::At && offset + bytes.size() > PUBLIC_KEY_LEN) {
        error = "offset " + std::to_string(offset) + " + pattern length " +
                std::to_string(bytes.size()) + " exceeds 32 bytes";
        return false;
    }

    out.kind = kind;
    out.text = text;
    out.bytes = std::move(bytes);
    out.offset = (kind == PatternKind::At) ? offset : 0;
    return true;
}

bool is_imm32_segment(const uint8_t* key, int segment) {
    const uint8_t* s = key + segment * SEGMENT_LEN;
    // Bit 31 of the low i32 decides the required fill of the high half
    const uint8_t fill = (s[3] & 0x80) ? 0xFF : 0x00;
    return s[4] == fill && s[5] == fill && s[6] == fill && s[7] == fill;
}

int find_imm32_segment(const uint8_t* key) {
    for (int segment = 0; segment < NUM_SEGMENTS; segment++) {
        if (is_imm32_segment(key, segment)) {
            return segment;
        }
    }
    return -1;
}

int32_t segment_i32(const uint8_t* key, int segment) {
    const uint8_t* s = key + segment * SEGMENT_LEN;
    uint32_t v = static_cast<uint32_t>(s[0]) |
                 (static_cast<uint32_t>(s[1]) << 8) |
                 (static_cast<uint32_t>(s[2]) << 16) |
                 (static_cast<uint32_t>(s[3]) << 24);
    return static_cast<int32_t>(v);
}

uint64_t segment_u64(const uint8_t* key, int segment) {
    const uint8_t* s = key + segment * SEGMENT_LEN;
    uint64_t v = 0;
    for (int i = 7; i >= 0; i--) {
        v = (v << 8) | s[i];
    }
    return v;
}

__attribute__((hot))
bool check_match(const uint8_t* key, const Pattern& pattern, MatchInfo& info) {
    const size_t len = pattern.bytes.size();
    const uint8_t* bytes = pattern.bytes.data();

    switch (pattern.kind) {
        case PatternKind::ImmediateSegment: {
            int segment = find_imm32_segment(key);
            if (segment < 0) return false;
            info.segment = segment;
            info.offset = static_cast<size_t>(segment) * SEGMENT_LEN;
            return true;
        }

        case PatternKind::Prefix:
            if (std::memcmp(key, bytes, len) != 0) return false;
            info.offset = 0;
            return true;

        case PatternKind::Suffix:
            if (std::memcmp(key + PUBLIC_KEY_LEN - len, bytes, len) != 0) return false;
            info.offset = PUBLIC_KEY_LEN - len;
            return true;

        case PatternKind::Contains:
            for (size_t pos = 0; pos + len <= PUBLIC_KEY_LEN; pos++) {
                if (key[pos] == bytes[0] && std::memcmp(key + pos, bytes, len) == 0) {
                    info.offset = pos;
                    return true;
                }
            }
            return false;

        case PatternKind::At:
            if (std::memcmp(key + pattern.offset, bytes, len) != 0) return false;
            info.offset = pattern.offset;
            return true;
    }
    return false;
}

const char* kind_to_string(PatternKind kind) {
    switch (kind) {
        case PatternKind::ImmediateSegment: return "imm32";
        case PatternKind::Prefix: return "prefix";
        case PatternKind::Suffix: return "suffix";
        case PatternKind::Contains: return "contains";
        case PatternKind::At: return "at";
    }
    return "prefix";
}

std::string pattern_label(const Pattern& pattern) {
    switch (pattern.kind) {
        case PatternKind::ImmediateSegment:
            return kind_to_string(pattern.kind);
        case PatternKind::Prefix:
        case PatternKind::Suffix:
        case PatternKind::Contains:
            return std::string(kind_to_string(pattern.kind)) + ":" + pattern.text;
        case PatternKind::At:
            return "at:" + std::to_string(pattern.offset) + ":" + pattern.text;
    }
    return pattern.text;
}

double estimate_attempts(const Pattern& pattern) {
    if (pattern.kind == PatternKind::ImmediateSegment) {
        // 2^-32 per segment, four independent segments
        return std::ldexp(1.0, 32) / NUM_SEGMENTS;
    }

    const size_t len = pattern.bytes.size();
    double combinations = std::ldexp(1.0, static_cast<int>(8 * len));
    if (pattern.kind == PatternKind::Contains) {
        return combinations / static_cast<double>(PUBLIC_KEY_LEN - len + 1);
    }
    return combinations;
}

bool parse_count(const std::string& text, uint64_t& count, std::string& error) {
    if (text.empty()) {
        error = "count is empty";
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            error = "invalid count \"" + text + "\"";
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            error = "count \"" + text + "\" is too large";
            return false;
        }
        value = value * 10 + digit;
    }
    if (value == 0) {
        error = "count must be at least 1";
        return false;
    }
    count = value;
    return true;
}

namespace {

std::vector<std::string> split_fields(const std::string& spec) {
    std::vector<std::string> parts;
    std::stringstream ss(spec);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field ("abc:")
    if (!spec.empty() && spec.back() == ':') {
        parts.emplace_back();
    }
    return parts;
}

bool parse_offset(const std::string& text, size_t& offset, std::string& error) {
    if (text.empty() || text.size() > 2) {
        error = "invalid offset \"" + text + "\" (expected 0-31)";
        return false;
    }
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            error = "invalid offset \"" + text + "\" (expected 0-31)";
            return false;
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    if (value >= PUBLIC_KEY_LEN) {
        error = "offset " + text + " is out of range (expected 0-31)";
        return false;
    }
    offset = value;
    return true;
}

} // namespace

bool parse_target_spec(const std::string& spec, bool allow_immediate,
                       Pattern& pattern, uint64_t& count, std::string& error) {
    std::vector<std::string> parts = split_fields(spec);
    if (parts.empty()) {
        error = "empty target";
        return false;
    }

    count = 1;
    const std::string& head = parts[0];

    // "IMM" cannot collide with a pattern: 'I' is outside the base58 alphabet
    if (head == "IMM") {
        if (!allow_immediate) {
            error = "IMM targets are only valid in batch mode";
            return false;
        }
        if (parts.size() > 2) {
            error = "invalid target \"" + spec + "\" (use IMM[:count])";
            return false;
        }
        if (parts.size() == 2 && !parse_count(parts[1], count, error)) {
            return false;
        }
        pattern = make_immediate_pattern();
        return true;
    }

    // A bare keyword with nothing after it is an ordinary pattern
    if (parts.size() >= 2 && (head == "prefix" || head == "suffix" || head == "contains")) {
        if (parts.size() > 3) {
            error = "invalid target \"" + spec + "\" (use " + head + ":<pattern>[:count])";
            return false;
        }
        PatternKind kind = (head == "prefix") ? PatternKind::Prefix
                         : (head == "suffix") ? PatternKind::Suffix
                         : PatternKind::Contains;
        if (parts.size() == 3 && !parse_count(parts[2], count, error)) {
            return false;
        }
        return make_vanity_pattern(kind, parts[1], 0, pattern, error);
    }

    if (parts.size() >= 2 && head == "at") {
        if (parts.size() < 3 || parts.size() > 4) {
            error = "invalid target \"" + spec + "\" (use at:<offset>:<pattern>[:count])";
            return false;
        }
        size_t offset = 0;
        if (!parse_offset(parts[1], offset, error)) {
            return false;
        }
        if (parts.size() == 4 && !parse_count(parts[3], count, error)) {
            return false;
        }
        return make_vanity_pattern(PatternKind::At, parts[2], offset, pattern, error);
    }

    if (parts.size() > 2) {
        error = "invalid target \"" + spec + "\" (use <pattern>[:count])";
        return false;
    }
    if (parts.size() == 2 && !parse_count(parts[1], count, error)) {
        return false;
    }
    return make_vanity_pattern(PatternKind::Prefix, head, 0, pattern, error);
}

} // namespace keygrind
