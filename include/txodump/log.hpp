#pragma once

#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace txodump {

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    error = 3
};

// Log sink handed to every component that reports progress.
// Formatting happens here, delivery in write().
class logger {
public:
    explicit
    logger(log_level threshold = log_level::info)
        : threshold_(threshold)
    {}

    virtual ~logger() = default;

    logger(logger const&) = delete;
    logger& operator=(logger const&) = delete;

    template<typename... Args>
    void log_print(log_level level, fmt::format_string<Args...> fmt, Args&&... args) {
        if ( ! enabled(level)) return;
        write(level, fmt::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        log_print(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        log_print(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) {
        log_print(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) {
        log_print(log_level::error, fmt, std::forward<Args>(args)...);
    }

    bool enabled(log_level level) const { return level >= threshold_; }

protected:
    virtual void write(log_level level, std::string const& msg) = 0;

private:
    log_level threshold_;
};

// Writes to stdout (errors to stderr) and, if opened, to a log file.
class stream_logger : public logger {
public:
    explicit
    stream_logger(log_level threshold = log_level::info)
        : logger(threshold)
    {}

    ~stream_logger() override;

    // Opens txodump_<name>_<YYYYmmdd_HHMMSS>.log in the working directory.
    // Returns false if the file could not be created.
    bool open_log_file(std::string const& name);
    void close_log_file();

    std::string const& log_file_name() const { return log_file_name_; }

protected:
    void write(log_level level, std::string const& msg) override;

private:
    std::ofstream log_file_;
    std::string log_file_name_;
};

// Keeps every message; used by the tests.
class memory_logger : public logger {
public:
    explicit
    memory_logger(log_level threshold = log_level::trace)
        : logger(threshold)
    {}

    std::vector<std::string> const& lines() const { return lines_; }
    bool contains(std::string_view needle) const;

protected:
    void write(log_level level, std::string const& msg) override;

private:
    std::vector<std::string> lines_;
};

} // namespace txodump
