#include <txodump/txo_writer.hpp>

#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/std.h>

namespace txodump {

txo_writer::txo_writer(fs::path folder, size_t flush_threshold)
    : folder_(std::move(folder))
    , flush_threshold_(flush_threshold)
{
    std::error_code ec;
    if ( ! fs::is_directory(folder_, ec)) {
        throw std::runtime_error(fmt::format(
            "Couldn't initialize txo_writer with folder {}: not an existing directory", folder_));
    }

    // a final file from an earlier run must not outlive this one unless it completes
    fs::remove(final_path(), ec);
    if (ec) {
        throw std::runtime_error(fmt::format(
            "Couldn't initialize txo_writer: unable to remove previous {}: {}", final_path(), ec.message()));
    }

    auto const path = tmp_path();
    file_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if ( ! file_) {
        throw std::runtime_error(fmt::format(
            "Couldn't initialize txo_writer: unable to create {}", path));
    }
    buffer_.reserve(flush_threshold_ + 128);
}

txo_writer::~txo_writer() {
    if ( ! finalized_ && file_.is_open()) {
        // Keep what was produced so far in the working file, nothing else.
        file_.write(buffer_.data(), std::streamsize(buffer_.size()));
        file_.close();
    }
}

void txo_writer::write(spend_record const& record) {
    if (finalized_) {
        throw std::logic_error("txo_writer: write after finalize");
    }
    auto const before = buffer_.size();
    fmt::format_to(std::back_inserter(buffer_), "{};{};{};{}\n",
        record.height, record.coin_age, record.fee_rate, record.value);
    bytes_written_ += buffer_.size() - before;
    ++lines_written_;

    if (buffer_.size() >= flush_threshold_) {
        flush();
    }
}

void txo_writer::flush() {
    if (finalized_) return;
    if ( ! buffer_.empty()) {
        file_.write(buffer_.data(), std::streamsize(buffer_.size()));
    }
    file_.flush();
    if ( ! file_) {
        // buffer_ is kept: those lines never reached the file
        throw std::runtime_error(fmt::format("txo_writer: write to {} failed", tmp_path()));
    }
    buffer_.clear();
}

void txo_writer::finalize() {
    if (finalized_) {
        throw std::logic_error("txo_writer: already finalized");
    }
    flush();
    file_.close();
    if ( ! file_) {
        throw std::runtime_error(fmt::format("txo_writer: closing {} failed", tmp_path()));
    }

    std::error_code ec;
    fs::rename(tmp_path(), final_path(), ec);
    if (ec) {
        throw std::runtime_error(fmt::format(
            "txo_writer: unable to rename {} to {}: {}", tmp_path(), final_path(), ec.message()));
    }
    finalized_ = true;
}

} // namespace txodump
