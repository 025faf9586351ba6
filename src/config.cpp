#include <txodump/config.hpp>

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace txodump {

namespace {

uint64_t parse_number(std::string_view option, std::string_view text, uint64_t max) {
    uint64_t res = 0;
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), res);
    if (ec != std::errc{} || ptr != text.data() + text.size() || res > max) {
        throw std::invalid_argument(fmt::format("Invalid value for {}: '{}'", option, text));
    }
    return res;
}

} // anonymous namespace

std::string usage(std::string const& program) {
    return fmt::format(
        "Usage: {} <blocks-dir> <dump-folder> [options]\n"
        "Dumps the spent transaction outputs into <dump-folder>/txo.csv\n"
        "\n"
        "Options:\n"
        "  --from N          first block height (default 0)\n"
        "  --to N            last block height, inclusive (default: all available)\n"
        "  --coin NAME       bitcoin | testnet3 (default bitcoin)\n"
        "  --reserve N       pre-size the UTXO set for N entries\n"
        "  --log-file NAME   also log to txodump_NAME_<timestamp>.log\n"
        "  --verbose         per-block debug output\n"
        "  --trace           also log every UTXO added and removed\n",
        program);
}

run_config parse_run_config(int argc, char const* const* argv) {
    run_config cfg;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
        std::string_view const arg = argv[i];

        auto const value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument(fmt::format("Missing value for {}", arg));
            }
            return argv[++i];
        };

        if (arg == "--from") {
            cfg.from_block = uint32_t(parse_number(arg, value(), std::numeric_limits<uint32_t>::max()));
        } else if (arg == "--to") {
            cfg.to_block = uint32_t(parse_number(arg, value(), std::numeric_limits<uint32_t>::max()));
        } else if (arg == "--coin") {
            auto const name = value();
            auto coin = coin_type::from_name(name);
            if ( ! coin) {
                throw std::invalid_argument(fmt::format("Unknown coin: '{}'", name));
            }
            cfg.coin = std::move(*coin);
        } else if (arg == "--reserve") {
            cfg.reserve = size_t(parse_number(arg, value(), std::numeric_limits<size_t>::max()));
        } else if (arg == "--log-file") {
            cfg.log_file = std::string(value());
        } else if (arg == "--verbose") {
            cfg.level = log_level::debug;
        } else if (arg == "--trace") {
            cfg.level = log_level::trace;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(fmt::format("Unknown option: {}", arg));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        throw std::invalid_argument("Expected <blocks-dir> and <dump-folder>");
    }
    cfg.blocks_dir = std::string(positional[0]);
    cfg.dump_folder = std::string(positional[1]);

    if (cfg.to_block && *cfg.to_block < cfg.from_block) {
        throw std::invalid_argument(fmt::format("--to {} is below --from {}", *cfg.to_block, cfg.from_block));
    }
    return cfg;
}

} // namespace txodump
