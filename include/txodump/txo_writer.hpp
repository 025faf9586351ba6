#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace txodump {

namespace fs = std::filesystem;

inline constexpr char const* txo_file_name = "txo.csv";
inline constexpr char const* txo_tmp_file_name = "txo.csv.tmp";

struct spend_record {
    uint32_t height;
    uint32_t coin_age;
    uint64_t fee_rate;
    uint64_t value;
};

// Append-only writer for spend records.
//
// Lines go to <folder>/txo.csv.tmp and only finalize() makes them visible
// as <folder>/txo.csv. A txo.csv left by an earlier run is removed on
// construction, so a writer destroyed without finalize() leaves the working
// file behind and no final one.
class txo_writer {
public:
    static constexpr size_t default_flush_threshold = 1024 * 1024;

    explicit
    txo_writer(fs::path folder, size_t flush_threshold = default_flush_threshold);
    ~txo_writer();

    txo_writer(txo_writer const&) = delete;
    txo_writer& operator=(txo_writer const&) = delete;

    // height;coin_age;fee_rate;value
    void write(spend_record const& record);

    void flush();

    // Flushes, closes and renames the working file to its final name.
    void finalize();

    bool finalized() const { return finalized_; }
    size_t lines_written() const { return lines_written_; }
    uint64_t bytes_written() const { return bytes_written_; }

    fs::path tmp_path() const { return folder_ / txo_tmp_file_name; }
    fs::path final_path() const { return folder_ / txo_file_name; }

private:
    fs::path folder_;
    std::ofstream file_;
    std::string buffer_;
    size_t flush_threshold_;
    size_t lines_written_ = 0;
    uint64_t bytes_written_ = 0;
    bool finalized_ = false;
};

} // namespace txodump
