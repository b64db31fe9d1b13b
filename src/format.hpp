#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace keygrind {

/**
 * Insert thousands separators: 1234567 -> "1,234,567"
 */
std::string format_number(uint64_t n);

/**
 * Human readable duration: "850ms", "12.4s", "3m 7s", "2h 15m", "1d 4h"
 */
std::string format_time(double seconds);

/**
 * Large estimates: grouped digits up to 10^15, scientific notation above
 */
std::string format_estimate(double value);

/**
 * Lowercase hex encoding of a byte range
 */
std::string to_hex(const uint8_t* data, size_t len);

} // namespace keygrind
