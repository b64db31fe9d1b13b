#include "base58.hpp"

#include <algorithm>
#include <iterator>

namespace keygrind {

const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

namespace {

// Reverse lookup, -1 for characters outside the alphabet
int digit_value(char c) {
    static int table[256];
    static bool initialized = [] {
        std::fill(std::begin(table), std::end(table), -1);
        for (int i = 0; i < 58; i++) {
            table[static_cast<unsigned char>(BASE58_ALPHABET[i])] = i;
        }
        return true;
    }();
    (void)initialized;
    return table[static_cast<unsigned char>(c)];
}

} // namespace

bool is_base58(const std::string& text) {
    for (char c : text) {
        if (digit_value(c) < 0) {
            return false;
        }
    }
    return true;
}

std::string base58_encode(const uint8_t* data, size_t len) {
    // Little-endian base58 digits of the big-endian input number
    std::vector<uint8_t> digits;
    digits.reserve(len * 138 / 100 + 1);

    for (size_t i = 0; i < len; i++) {
        int carry = data[i];
        for (size_t j = 0; j < digits.size(); j++) {
            carry += digits[j] * 256;
            digits[j] = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len && data[i] == 0; i++) {
        result.push_back(BASE58_ALPHABET[0]);
    }
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

bool base58_decode(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    if (text.empty()) {
        return false;
    }

    // Little-endian base256 bytes of the number
    std::vector<uint8_t> bytes;
    bytes.reserve(text.size());

    for (char c : text) {
        int carry = digit_value(c);
        if (carry < 0) {
            return false;
        }
        for (size_t j = 0; j < bytes.size(); j++) {
            carry += bytes[j] * 58;
            bytes[j] = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    size_t leading_ones = 0;
    while (leading_ones < text.size() && text[leading_ones] == BASE58_ALPHABET[0]) {
        leading_ones++;
    }

    out.assign(leading_ones, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return true;
}

} // namespace keygrind
