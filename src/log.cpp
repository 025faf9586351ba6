#include <txodump/log.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace txodump {

stream_logger::~stream_logger() {
    close_log_file();
}

bool stream_logger::open_log_file(std::string const& name) {
    close_log_file();

    auto const now = std::chrono::system_clock::now();
    auto const now_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "txodump_" << name << "_"
       << std::put_time(std::localtime(&now_time_t), "%Y%m%d_%H%M%S") << ".log";

    log_file_.open(ss.str());
    if ( ! log_file_.is_open()) {
        std::cerr << "Failed to open log file: " << ss.str() << std::endl;
        return false;
    }
    log_file_name_ = ss.str();

    std::stringstream time_ss;
    time_ss << std::put_time(std::localtime(&now_time_t), "%Y-%m-%d %H:%M:%S");
    info("Log started at: {}\n", time_ss.str());
    return true;
}

void stream_logger::close_log_file() {
    if (log_file_.is_open()) {
        log_file_ << "Log completed.\n";
        log_file_.close();
    }
}

void stream_logger::write(log_level level, std::string const& msg) {
    if (level == log_level::error) {
        fmt::print(stderr, "{}", msg);
    } else {
        fmt::print("{}", msg);
    }
    if (log_file_.is_open()) {
        log_file_ << msg;
        log_file_.flush();
    }
}

bool memory_logger::contains(std::string_view needle) const {
    for (auto const& line : lines_) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

void memory_logger::write(log_level, std::string const& msg) {
    lines_.push_back(msg);
}

} // namespace txodump
