#include <txodump/spend_recorder.hpp>

#include <stdexcept>

#include <fmt/format.h>

namespace txodump {

uint64_t transaction_fee(transaction const& tx, utxo_set const& utxos) {
    uint64_t in_value = 0;
    for (auto const& in : tx.inputs) {
        if (in.previous_output.is_null()) continue;
        if (auto const entry = utxos.find(in.previous_output.key())) {
            in_value += entry->value;
        }
    }
    auto const out_value = tx.total_output_value();
    return in_value > out_value ? in_value - out_value : 0;
}

uint64_t fee_rate(transaction const& tx, utxo_set const& utxos) {
    if (tx.serialized_size == 0) return 0;
    return transaction_fee(tx, utxos) / tx.serialized_size;
}

transaction_summary process_transaction(transaction const& tx,
                                        uint32_t height,
                                        utxo_set& utxos,
                                        txo_writer& writer,
                                        logger& log) {
    transaction_summary res;
    auto const rate = fee_rate(tx, utxos);
    bool const tracing = log.enabled(log_level::trace);

    for (auto const& in : tx.inputs) {
        if (in.previous_output.is_null()) {
            ++res.coinbase_inputs;
            continue;
        }

        auto const key = in.previous_output.key();
        auto const entry = utxos.find(key);
        if ( ! entry) {
            ++res.missing;
            continue;
        }

        if (entry->height > height) {
            throw std::runtime_error(fmt::format(
                "output {} created at height {} spent at lower height {}",
                format_key(key), entry->height, height));
        }

        if (tracing) {
            log.trace("Removing {} from UTXO set.\n", format_key(key));
        }
        writer.write(spend_record{height, height - entry->height, rate, entry->value});
        utxos.erase(key);
        ++res.spends;
    }

    for (size_t i = 0; i < tx.outputs.size(); ++i) {
        auto const key = make_utxo_key(tx.hash, uint32_t(i));
        if (tracing) {
            log.trace("Adding UTXO {} to the UTXO set.\n", format_key(key));
        }
        if ( ! utxos.insert(key, tx.outputs[i].value, height)) {
            ++res.overwrites;
        }
    }
    return res;
}

} // namespace txodump
