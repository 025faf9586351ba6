#include <txodump/block_source.hpp>

#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/std.h>

namespace txodump {

fs::path block_file_path(fs::path const& dir, uint32_t height) {
    uint32_t const first = height / block_file_step * block_file_step;
    return dir / fmt::format("block-raw-{}-{}.csv", first, first + block_file_step - 1);
}

raw_block_reader::raw_block_reader(fs::path dir, uint32_t from_block, std::optional<uint32_t> to_block)
    : dir_(std::move(dir))
    , to_block_(to_block)
    , next_height_(from_block)
{
    std::error_code ec;
    if ( ! fs::is_directory(dir_, ec)) {
        throw std::runtime_error(fmt::format("Blocks directory {} does not exist", dir_));
    }
    if ( ! open_file_for(next_height_)) {
        throw std::runtime_error(fmt::format("Unable to open file: {}", block_file_path(dir_, next_height_)));
    }

    // skip the lines before from_block in its file
    uint32_t const first = from_block / block_file_step * block_file_step;
    for (uint32_t i = first; i < from_block; ++i) {
        if ( ! std::getline(file_, line_)) {
            exhausted_ = true;
            break;
        }
    }
}

bool raw_block_reader::open_file_for(uint32_t height) {
    file_.close();
    file_.clear();
    auto const path = block_file_path(dir_, height);
    if ( ! fs::exists(path)) {
        return false;
    }
    file_.open(path);
    return bool(file_);
}

bool raw_block_reader::end_of_data() {
    exhausted_ = true;
    if (to_block_ && next_height_ <= *to_block_) {
        throw std::runtime_error(fmt::format("Block {} not found in {} (--to is {})",
            next_height_, block_file_path(dir_, next_height_), *to_block_));
    }
    return false;
}

bool raw_block_reader::next(uint32_t& height, bytes_t& raw) {
    if (exhausted_) return end_of_data();
    if (to_block_ && next_height_ > *to_block_) {
        exhausted_ = true;
        return false;
    }

    if ( ! file_.is_open()) {
        if ( ! open_file_for(next_height_)) {
            return end_of_data();
        }
    }

    if ( ! std::getline(file_, line_)) {
        return end_of_data();
    }
    if (line_.empty() || line_ == "\r") {
        if (file_.peek() != std::char_traits<char>::eof()) {
            throw std::runtime_error(fmt::format("Block {} in {}: empty line",
                next_height_, block_file_path(dir_, next_height_)));
        }
        return end_of_data();
    }

    try {
        raw = hex2vec(line_);
    } catch (std::invalid_argument const& e) {
        throw std::runtime_error(fmt::format("Block {} in {}: {}",
            next_height_, block_file_path(dir_, next_height_), e.what()));
    }
    height = next_height_;
    ++next_height_;

    // the next block lives in the following file
    if (next_height_ % block_file_step == 0) {
        file_.close();
    }
    return true;
}

} // namespace txodump
