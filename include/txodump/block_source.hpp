#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <txodump/common.hpp>

namespace txodump {

namespace fs = std::filesystem;

// Raw blocks are stored hex encoded, one block per line, in files of
// block_file_step blocks each: block-raw-0-9999.csv, block-raw-10000-19999.csv, ...
inline constexpr uint32_t block_file_step = 10'000;

fs::path block_file_path(fs::path const& dir, uint32_t height);

// Sequential reader over the raw block files of a directory, yielding
// (height, raw bytes) in ascending height order from from_block up to
// to_block (inclusive) or the last block available.
class raw_block_reader {
public:
    raw_block_reader(fs::path dir, uint32_t from_block, std::optional<uint32_t> to_block = std::nullopt);

    // False once the range or the available files are exhausted.
    // Throws std::runtime_error if the data ends before to_block, or on a
    // line that doesn't decode (an empty line before the end of a file
    // included).
    bool next(uint32_t& height, bytes_t& raw);

private:
    bool open_file_for(uint32_t height);
    bool end_of_data();

    fs::path dir_;
    std::optional<uint32_t> to_block_;
    uint32_t next_height_;
    std::ifstream file_;
    std::string line_;
    bool exhausted_ = false;
};

} // namespace txodump
