#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

#include <txodump/common_utxo.hpp>

namespace txodump {

// Block and transaction values as delivered by the block source.
// Only the fields needed to follow outputs from creation to spend are kept.

struct output_point {
    hash_digest hash;
    uint32_t index;

    bool is_null() const { return index == coinbase_index; }
    utxo_key_t key() const { return make_utxo_key(hash, index); }
};

struct input {
    output_point previous_output;
};

struct output {
    uint64_t value;
};

struct transaction {
    hash_digest hash;
    std::vector<input> inputs;
    std::vector<output> outputs;
    size_t serialized_size = 0;

    uint64_t total_output_value() const {
        uint64_t total = 0;
        for (auto const& out : outputs) {
            total += out.value;
        }
        return total;
    }
};

struct block {
    std::vector<transaction> transactions;
};

// Network the stream belongs to. Only used for reporting.
struct coin_type {
    std::string name;
    uint32_t magic;

    static coin_type bitcoin() { return {"Bitcoin", 0xd9b4bef9}; }
    static coin_type testnet3() { return {"TestNet3", 0x0709110b}; }

    static std::optional<coin_type> from_name(std::string_view name) {
        if (name == "bitcoin") return bitcoin();
        if (name == "testnet3") return testnet3();
        return std::nullopt;
    }
};

} // namespace txodump
