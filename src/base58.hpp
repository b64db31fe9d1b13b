#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keygrind {

// Bitcoin/Solana alphabet (no 0, O, I, l)
extern const char BASE58_ALPHABET[];

/**
 * Check that every character of text belongs to the base58 alphabet
 */
bool is_base58(const std::string& text);

/**
 * Encode bytes as base58. Each leading zero byte becomes a leading '1'.
 */
std::string base58_encode(const uint8_t* data, size_t len);

/**
 * Decode base58 text into bytes
 *
 * @param text Input string (must be non-empty and use only the base58 alphabet)
 * @param out Decoded bytes, big-endian, with one zero byte per leading '1'
 * @return false if text is empty or contains a character outside the alphabet
 */
bool base58_decode(const std::string& text, std::vector<uint8_t>& out);

} // namespace keygrind
