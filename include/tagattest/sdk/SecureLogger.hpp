/**
 * @file SecureLogger.hpp
 * @brief Logging facility with levels, file rotation and a stderr mirror
 */

#pragma once

#include "tagattest/sdk/constants.hpp"
#include <atomic>
#include <string>
#include <mutex>
#include <fstream>
#include <chrono>
#include <cstdio>
#include <optional>

namespace tagattest {
namespace sdk {

/**
 * @brief Process-wide logger
 *
 * Until initialize() is called with a directory, messages at or above the
 * stderr threshold go to stderr only.
 */
class SecureLogger {
public:
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Get the singleton instance of the logger
     * @return Reference to the singleton instance
     */
    static SecureLogger& instance();

    /**
     * @brief Initialize the logger
     * @param log_path Directory for log files; empty keeps stderr-only output
     * @param min_level Minimum log level to record
     */
    void initialize(const std::string& log_path = constants::LOG_PATH,
                    LogLevel min_level = LogLevel::INFO);

    /**
     * @brief Log a message with a specific level
     */
    void log(LogLevel level, const std::string& message);

    /**
     * @brief Format and log a message with a specific level
     * @param level Log level
     * @param format printf-style format string
     * @param args Format arguments
     */
    template <typename... Args>
    void logf(LogLevel level, const char* format, Args... args) {
        if (!is_level_enabled(level)) {
            return;
        }
        char buffer[2048];
        std::snprintf(buffer, sizeof(buffer), format, args...);
        log(level, std::string(buffer));
    }

    // Convenience methods for different log levels
    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    ~SecureLogger();

    /**
     * @brief Set the lowest level mirrored to stderr (ERROR by default)
     */
    void set_stderr_level(LogLevel level);

    std::string get_log_path() const { return log_path_; }

    /**
     * @brief Path of the file currently written, empty in stderr-only mode
     */
    std::string get_current_file() const;

    void flush();

    /**
     * @brief Parse "trace", "debug", "info", "warning", "error" or "critical"
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

    static std::string level_to_string(LogLevel level);

private:
    SecureLogger();

    SecureLogger(const SecureLogger&) = delete;
    SecureLogger& operator=(const SecureLogger&) = delete;

    void log_internal(LogLevel level, const std::string& message);

    // Checked before formatting, outside log_mutex_
    bool is_level_enabled(LogLevel level) const { return level >= min_level_.load(); }

    // Open a fresh file in log_path_ and prune old ones
    void open_log_file();
    void check_and_rotate_log();
    void prune_old_logs();

    static std::string get_current_timestamp(const char* format = "%Y-%m-%d %H:%M:%S");

    static std::mutex instance_mutex_;
    static SecureLogger* instance_;

    mutable std::mutex log_mutex_;
    std::ofstream log_file_;
    std::string log_path_;
    std::string current_file_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    LogLevel stderr_level_ = LogLevel::ERROR;
    bool initialized_ = false;
    uint64_t rotation_sequence_ = 0;
    size_t max_log_file_size_ = constants::MAX_LOG_FILE_SIZE;
    size_t max_log_files_ = constants::MAX_LOG_FILES;
};

} // namespace sdk
} // namespace tagattest
