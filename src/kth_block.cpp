#include <txodump/kth_block.hpp>

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace txodump {

namespace {

hash_digest to_hash(kth::hash_digest const& h) {
    hash_digest res;
    std::copy(h.begin(), h.end(), res.begin());
    return res;
}

} // anonymous namespace

transaction to_chain_transaction(kth::domain::chain::transaction const& tx) {
    transaction res;
    res.hash = to_hash(tx.hash());
    res.serialized_size = tx.serialized_size(true);

    res.inputs.reserve(tx.inputs().size());
    for (auto const& in : tx.inputs()) {
        auto const& prev = in.previous_output();
        res.inputs.push_back(input{output_point{to_hash(prev.hash()), prev.index()}});
    }

    res.outputs.reserve(tx.outputs().size());
    for (auto const& out : tx.outputs()) {
        res.outputs.push_back(output{out.value()});
    }
    return res;
}

block to_chain_block(kth::domain::chain::block const& blk) {
    block res;
    auto const& txs = blk.transactions();
    res.transactions.reserve(txs.size());
    for (auto const& tx : txs) {
        res.transactions.push_back(to_chain_transaction(tx));
    }
    return res;
}

block decode_block(bytes_t const& raw, uint32_t height) {
    kth::byte_reader reader(raw);
    auto blk_exp = kth::domain::chain::block::from_data(reader);
    if ( ! blk_exp) {
        throw std::runtime_error(fmt::format("Error reading block {} ({} bytes)", height, raw.size()));
    }
    return to_chain_block(*blk_exp);
}

} // namespace txodump
