#ifndef TXODUMP_COMMON_HPP_
#define TXODUMP_COMMON_HPP_

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace txodump {

using bytes_t = std::vector<uint8_t>;

inline
uint8_t char2int(char input) {
    if(input >= '0' && input <= '9') return input - '0';
    if(input >= 'A' && input <= 'F') return input - 'A' + 10;
    if(input >= 'a' && input <= 'f') return input - 'a' + 10;
    throw std::invalid_argument(fmt::format("Invalid hex character: '{}'", input));
}

inline
bytes_t hex2vec(std::string_view src) {
    // tolerate the CR of files written on Windows
    if ( ! src.empty() && src.back() == '\r') {
        src.remove_suffix(1);
    }
    if (src.size() % 2 != 0) {
        throw std::invalid_argument(fmt::format("Odd-length hex string ({} chars)", src.size()));
    }
    bytes_t bytes(src.size() / 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = char2int(src[2 * i]) * 16 + char2int(src[2 * i + 1]);
    }
    return bytes;
}

// Divides by 1000 until below 1000 (or out of suffixes).
struct si_scaled {
    double value;
    char const* suffix;
};

inline
si_scaled to_si(double n) {
    static constexpr char const* suffixes[] = {"", "k", "M", "B", "T"};
    size_t i = 0;
    for (; n >= 1000.0 && i + 1 < std::size(suffixes); ++i) {
        n /= 1000.0;
    }
    return {n, suffixes[i]};
}

// 1234567 -> "1.23M"
inline
std::string format_si(uint64_t n) {
    auto const s = to_si(double(n));
    return fmt::format("{:.3g}{}", s.value, s.suffix);
}

// rates are shown without decimals: 2400.0 -> "2k"
inline
std::string format_si_rate(double n) {
    auto const s = to_si(n);
    return fmt::format("{:.0f}{}", s.value, s.suffix);
}

// 250630422 -> "0.2506s (250630422ns)"
inline
std::string format_time(uint64_t ns) {
    return fmt::format("{:.4f}s ({}ns)", double(ns) * 1e-9, ns);
}

} // namespace txodump

#endif // TXODUMP_COMMON_HPP_
