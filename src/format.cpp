#include "format.hpp"

#include <iomanip>
#include <sstream>

namespace keygrind {

std::string format_number(uint64_t n) {
    std::string s = std::to_string(n);
    int insert_pos = static_cast<int>(s.length()) - 3;
    while (insert_pos > 0) {
        s.insert(insert_pos, ",");
        insert_pos -= 3;
    }
    return s;
}

std::string format_time(double seconds) {
    if (seconds < 1.0) {
        return std::to_string(static_cast<int>(seconds * 1000)) + "ms";
    } else if (seconds < 60.0) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << seconds << "s";
        return oss.str();
    } else if (seconds < 3600.0) {
        int mins = static_cast<int>(seconds / 60);
        int secs = static_cast<int>(seconds) % 60;
        return std::to_string(mins) + "m " + std::to_string(secs) + "s";
    } else if (seconds < 86400.0) {
        int hours = static_cast<int>(seconds / 3600);
        int mins = (static_cast<int>(seconds) % 3600) / 60;
        return std::to_string(hours) + "h " + std::to_string(mins) + "m";
    } else if (seconds < 86400.0 * 365 * 1e6) {
        uint64_t total = static_cast<uint64_t>(seconds);
        return std::to_string(total / 86400) + "d " + std::to_string((total % 86400) / 3600) + "h";
    } else {
        return "> 1M years";
    }
}

std::string format_estimate(double value) {
    if (value < 1e15) {
        return format_number(static_cast<uint64_t>(value));
    }
    std::ostringstream oss;
    oss << std::scientific << std::setprecision(2) << value;
    return oss.str();
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

} // namespace keygrind
