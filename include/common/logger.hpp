#ifndef BURSTPACK_LOGGER_HPP
#define BURSTPACK_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <optional>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// Parses "DEBUG", "INFO", "WARN"/"WARNING", "ERROR" (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();

    // Opens (appending) the log file, creating its parent directory.
    void init(const std::string& filename, LogLevel min_level = LogLevel::INFO);
    void set_level(LogLevel min_level);
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args&&... args) {
        if (!enabled(level)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    mutable std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // BURSTPACK_LOGGER_HPP
