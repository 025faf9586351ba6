#pragma once

#include <cstddef>
#include <cstdint>

#include <txodump/chain.hpp>
#include <txodump/log.hpp>
#include <txodump/txo_writer.hpp>
#include <txodump/utxo_set.hpp>

namespace txodump {

// Fee paid by tx: value of the outputs it spends (as currently in the set)
// minus the value it creates. Coinbase inputs and outputs unknown to the set
// count as zero; a negative result is clamped to zero.
uint64_t transaction_fee(transaction const& tx, utxo_set const& utxos);

// Fee divided by serialized size, truncated. Zero for a zero-sized tx.
// Computed once per transaction and repeated in every record of its inputs.
uint64_t fee_rate(transaction const& tx, utxo_set const& utxos);

struct transaction_summary {
    size_t spends = 0;          // records written
    size_t missing = 0;         // inputs whose output was never seen
    size_t coinbase_inputs = 0;
    size_t overwrites = 0;      // outputs that replaced a live entry
};

// Writes one record per input spending a known output and removes that
// output from the set, then adds the outputs of tx at height.
// Every removal and insertion is logged at trace level.
transaction_summary process_transaction(transaction const& tx,
                                        uint32_t height,
                                        utxo_set& utxos,
                                        txo_writer& writer,
                                        logger& log);

} // namespace txodump
