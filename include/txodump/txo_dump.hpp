#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include <txodump/chain.hpp>
#include <txodump/log.hpp>
#include <txodump/txo_writer.hpp>
#include <txodump/utxo_set.hpp>

namespace txodump {

struct run_totals {
    size_t blocks = 0;
    uint64_t transactions = 0;
    uint64_t inputs = 0;
    uint64_t outputs = 0;
    uint64_t spends = 0;
    uint64_t missing_inputs = 0;
};

// Follows every output from creation to spend over an ordered block stream
// and dumps one line per spend to <dump_folder>/txo.csv.
//
// Lifecycle: idle -> started (on_start) -> running (on_block, repeatedly)
// -> completed (on_complete). The final file exists only once completed.
// An exception thrown while a block is being applied, or while finalizing,
// leaves the set and the output half updated: the object moves to failed
// and refuses every further call.
class txo_dump {
public:
    enum class state {
        idle,
        started,
        running,
        completed,
        failed
    };

    // Throws std::runtime_error if the working file can't be created in dump_folder.
    txo_dump(std::filesystem::path const& dump_folder, logger& log, size_t expected_utxos = 0);

    txo_dump(txo_dump const&) = delete;
    txo_dump& operator=(txo_dump const&) = delete;

    void on_start(coin_type const& coin, uint32_t start_height);
    void on_block(block const& blk, uint32_t height);
    void on_complete(uint32_t final_height);

    state current_state() const { return state_; }
    run_totals const& totals() const { return totals_; }
    utxo_set const& utxos() const { return utxo_set_; }
    txo_writer const& writer() const { return writer_; }

    uint32_t start_height() const { return start_height_; }
    std::optional<uint32_t> last_height() const { return last_height_; }

private:
    // Resuming from a previously dumped UTXO set is not supported: there is
    // no on-disk format for it. Always reports that nothing was loaded.
    std::optional<size_t> load_utxo_set();

    void require_state(std::string_view operation, state expected1, state expected2) const;

    std::filesystem::path dump_folder_;
    logger& log_;
    size_t expected_utxos_;
    txo_writer writer_;
    utxo_set utxo_set_;
    run_totals totals_;
    state state_ = state::idle;
    uint32_t start_height_ = 0;
    std::optional<uint32_t> last_height_;
};

std::string_view to_string(txo_dump::state s);

} // namespace txodump
