#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/std.h>

#include <txodump/block_source.hpp>
#include <txodump/common.hpp>
#include <txodump/config.hpp>
#include <txodump/kth_block.hpp>
#include <txodump/log.hpp>
#include <txodump/txo_dump.hpp>

using namespace txodump;

namespace {

constexpr uint32_t progress_every = 10'000;

void run(run_config const& cfg, logger& log) {
    txo_dump dump(cfg.dump_folder, log, cfg.reserve);
    raw_block_reader reader(cfg.blocks_dir, cfg.from_block, cfg.to_block);

    log.info("Reading blocks from {}\n", cfg.blocks_dir);
    dump.on_start(cfg.coin, cfg.from_block);

    auto const start = std::chrono::steady_clock::now();
    uint32_t height = 0;
    bytes_t raw;
    while (reader.next(height, raw)) {
        dump.on_block(decode_block(raw, height), height);

        if ((height + 1) % progress_every == 0) {
            auto const elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - start).count();
            auto const& totals = dump.totals();
            log.info("Block {:7} - UTXOs: {:>7} - spends: {:>7} - {:>6} txs/sec\n",
                     height,
                     format_si(dump.utxos().size()),
                     format_si(totals.spends),
                     format_si_rate(double(totals.transactions) * 1e9 / double(elapsed)));
        }
    }

    auto const final_height = dump.last_height().value_or(cfg.from_block);
    dump.on_complete(final_height);

    auto const elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start).count();
    log.info("Total time: {}\n", format_time(uint64_t(elapsed)));
    log.info("Output: {}\n", dump.writer().final_path());
}

} // anonymous namespace

int main(int argc, char** argv) {
    run_config cfg;
    try {
        cfg = parse_run_config(argc, argv);
    } catch (std::invalid_argument const& e) {
        fmt::print(stderr, "{}\n\n{}", e.what(), usage(argc > 0 ? argv[0] : "txodump"));
        return 1;
    }

    stream_logger log(cfg.level);
    if ( ! cfg.log_file.empty() && log.open_log_file(cfg.log_file)) {
        log.info("Logging to {}\n", log.log_file_name());
    }

    try {
        run(cfg, log);
    } catch (std::exception const& e) {
        log.error("txodump failed: {}\n", e.what());
        return 2;
    }
    return 0;
}
