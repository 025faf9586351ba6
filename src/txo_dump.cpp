#include <txodump/txo_dump.hpp>

#include <stdexcept>

#include <fmt/format.h>
#include <fmt/std.h>

#include <txodump/spend_recorder.hpp>

namespace txodump {

std::string_view to_string(txo_dump::state s) {
    switch (s) {
        case txo_dump::state::idle:      return "idle";
        case txo_dump::state::started:   return "started";
        case txo_dump::state::running:   return "running";
        case txo_dump::state::completed: return "completed";
        case txo_dump::state::failed:    return "failed";
    }
    return "unknown";
}

txo_dump::txo_dump(std::filesystem::path const& dump_folder, logger& log, size_t expected_utxos)
    : dump_folder_(dump_folder)
    , log_(log)
    , expected_utxos_(expected_utxos)
    , writer_(dump_folder)
{}

void txo_dump::require_state(std::string_view operation, state expected1, state expected2) const {
    if (state_ != expected1 && state_ != expected2) {
        throw std::logic_error(fmt::format("txo_dump: {} not allowed in state {}", operation, to_string(state_)));
    }
}

std::optional<size_t> txo_dump::load_utxo_set() {
    return std::nullopt;
}

void txo_dump::on_start(coin_type const& coin, uint32_t start_height) {
    require_state("on_start", state::idle, state::idle);

    start_height_ = start_height;
    log_.info("txo_dump: using dump folder {} for {} (magic {:#010x}) starting at block {}\n",
              dump_folder_, coin.name, coin.magic, start_height_);

    utxo_set_.clear();
    if (expected_utxos_ > 0) {
        log_.info("txo_dump: reserving space for {} UTXOs\n", expected_utxos_);
        utxo_set_.reserve(expected_utxos_);
    }

    if (auto const loaded = load_utxo_set()) {
        log_.info("txo_dump: loaded {} UTXOs\n", *loaded);
    } else {
        log_.info("txo_dump: no previous UTXO set loaded\n");
    }
    state_ = state::started;
}

void txo_dump::on_block(block const& blk, uint32_t height) {
    require_state("on_block", state::started, state::running);

    if (last_height_ ? height <= *last_height_ : height < start_height_) {
        throw std::runtime_error(fmt::format(
            "txo_dump: block {} delivered out of order (last: {}, start: {})",
            height, last_height_ ? fmt::format("{}", *last_height_) : std::string("none"), start_height_));
    }

    log_.debug("txo_dump: block {} with {} transactions\n", height, blk.transactions.size());

    try {
        for (auto const& tx : blk.transactions) {
            totals_.inputs += tx.inputs.size();
            totals_.outputs += tx.outputs.size();

            auto const summary = process_transaction(tx, height, utxo_set_, writer_, log_);
            totals_.spends += summary.spends;
            totals_.missing_inputs += summary.missing;

            if (summary.overwrites > 0) {
                log_.debug("txo_dump: {} outputs of a transaction in block {} replaced live entries\n",
                           summary.overwrites, height);
            }
        }
    } catch (std::exception const& e) {
        state_ = state::failed;
        log_.error("txo_dump: block {} failed, run aborted: {}\n", height, e.what());
        throw;
    }
    totals_.transactions += blk.transactions.size();
    ++totals_.blocks;

    last_height_ = height;
    state_ = state::running;
}

void txo_dump::on_complete(uint32_t final_height) {
    require_state("on_complete", state::started, state::running);

    try {
        writer_.finalize();
    } catch (std::exception const& e) {
        state_ = state::failed;
        log_.error("txo_dump: finalizing output failed, run aborted: {}\n", e.what());
        throw;
    }
    state_ = state::completed;

    log_.info("txo_dump: done. Dumped all {} blocks (final height {}):\n"
              "\t-> transactions: {:9}\n"
              "\t-> inputs:       {:9}\n"
              "\t-> outputs:      {:9}\n"
              "\t-> spends:       {:9}\n"
              "\t-> unknown:      {:9}\n",
              totals_.blocks, final_height,
              totals_.transactions, totals_.inputs, totals_.outputs,
              totals_.spends, totals_.missing_inputs);
    utxo_set_.print_statistics(log_);
}

} // namespace txodump
