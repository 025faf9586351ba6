#ifndef TXODUMP_COMMON_UTXO_HPP_
#define TXODUMP_COMMON_UTXO_HPP_

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

#include <fmt/format.h>

namespace txodump {

inline constexpr size_t hash_size = 32;
inline constexpr size_t utxo_key_size = hash_size + sizeof(uint32_t);   // 32 bytes hash + 4 bytes index

// Previous-output index carried by the input of a coinbase transaction.
inline constexpr uint32_t coinbase_index = 0xffffffff;

using hash_digest = std::array<uint8_t, hash_size>;
using utxo_key_t = std::array<uint8_t, utxo_key_size>;

// Key layout: transaction hash followed by the output index, little endian.
inline
utxo_key_t make_utxo_key(hash_digest const& txid, uint32_t index) {
    utxo_key_t key;
    std::copy(txid.begin(), txid.end(), key.begin());
    key[32] = uint8_t(index);
    key[33] = uint8_t(index >> 8);
    key[34] = uint8_t(index >> 16);
    key[35] = uint8_t(index >> 24);
    return key;
}

inline
uint32_t key_index(utxo_key_t const& key) {
    return uint32_t(key[32]) |
           uint32_t(key[33]) << 8 |
           uint32_t(key[34]) << 16 |
           uint32_t(key[35]) << 24;
}

// "<txid in display order>:<index>"
inline
std::string format_key(utxo_key_t const& key) {
    std::string res;
    res.reserve(hash_size * 2 + 11);
    for (size_t i = 0; i < hash_size; ++i) {
        fmt::format_to(std::back_inserter(res), "{:02x}", key[hash_size - 1 - i]);
    }
    fmt::format_to(std::back_inserter(res), ":{}", key_index(key));
    return res;
}

// Transaction ids are double-SHA256 digests, so any 8 of their bytes are
// already uniformly distributed. The index only needs to be folded in.
struct txid_prefix_hash {
    size_t operator()(utxo_key_t const& key) const noexcept {
        uint64_t h = 0;
        for (size_t i = 0; i < sizeof(uint64_t); ++i) {
            h |= uint64_t(key[i]) << (8 * i);
        }
        return size_t(h ^ (uint64_t(key_index(key)) * 0x9e3779b97f4a7c15ULL));
    }
};

} // namespace txodump

#endif // TXODUMP_COMMON_UTXO_HPP_
