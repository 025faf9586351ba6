#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <txodump/chain.hpp>
#include <txodump/log.hpp>

namespace txodump {

struct run_config {
    std::filesystem::path blocks_dir;
    std::filesystem::path dump_folder;
    uint32_t from_block = 0;
    std::optional<uint32_t> to_block;
    coin_type coin = coin_type::bitcoin();
    size_t reserve = 0;
    std::string log_file;           // empty: no log file
    log_level level = log_level::info;
};

std::string usage(std::string const& program);

// txodump <blocks-dir> <dump-folder> [--from N] [--to N] [--coin NAME]
//         [--reserve N] [--log-file NAME] [--verbose | --trace]
// Throws std::invalid_argument on bad usage.
run_config parse_run_config(int argc, char const* const* argv);

} // namespace txodump
