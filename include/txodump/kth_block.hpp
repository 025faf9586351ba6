#pragma once

#include <cstdint>

#include <kth/domain.hpp>

#include <txodump/chain.hpp>
#include <txodump/common.hpp>

namespace txodump {

transaction to_chain_transaction(kth::domain::chain::transaction const& tx);
block to_chain_block(kth::domain::chain::block const& blk);

// Parses a raw (wire format) block with Knuth. Throws std::runtime_error
// when the bytes are not a block.
block decode_block(bytes_t const& raw, uint32_t height);

} // namespace txodump
