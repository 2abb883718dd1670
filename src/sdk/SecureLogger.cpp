#include "tagattest/sdk/SecureLogger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>
#include <cstdio>
#include <ctime>

namespace tagattest {
namespace sdk {

namespace {
const char* LOG_FILE_PREFIX = "tagattest_";
const char* LOG_FILE_SUFFIX = ".log";
}

std::mutex SecureLogger::instance_mutex_;
SecureLogger* SecureLogger::instance_ = nullptr;

SecureLogger& SecureLogger::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = new SecureLogger();
    }
    return *instance_;
}

SecureLogger::SecureLogger()
    : initialized_(false) {
}

SecureLogger::~SecureLogger() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void SecureLogger::initialize(const std::string& log_path, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (initialized_) {
        log_internal(LogLevel::DEBUG, "Logger already initialized, reinitializing with new parameters");
    }

    min_level_ = min_level;
    log_path_ = log_path;

    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_file_.clear();

    if (!log_path_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path_, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << log_path_ << ": " << ec.message()
                      << ", logging to stderr only" << std::endl;
            log_path_.clear();
        } else {
            open_log_file();
        }
    }

    initialized_ = true;
    log_internal(LogLevel::INFO, "SecureLogger initialized (level " + level_to_string(min_level_.load()) + ")");
}

void SecureLogger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(level, message);
}

void SecureLogger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void SecureLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void SecureLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void SecureLogger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void SecureLogger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void SecureLogger::critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

std::string SecureLogger::get_current_file() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return current_file_;
}

void SecureLogger::set_stderr_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    stderr_level_ = level;
}

void SecureLogger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
    std::cerr.flush();
}

void SecureLogger::log_internal(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }

    const std::string line = "[" + get_current_timestamp() + "] [" + level_to_string(level) + "] " + message;

    if (log_file_.is_open()) {
        check_and_rotate_log();
        log_file_ << line << '\n';
        log_file_.flush();
    }

    // Mirror to stderr; in stderr-only mode this is the only sink
    if (level >= stderr_level_) {
        std::cerr << line << std::endl;
    }
}

void SecureLogger::open_log_file() {
    ++rotation_sequence_;
    char sequence[16];
    std::snprintf(sequence, sizeof(sequence), "%06llu",
                  static_cast<unsigned long long>(rotation_sequence_));
    std::string filename = log_path_ + "/" + LOG_FILE_PREFIX +
                           get_current_timestamp("%Y%m%d_%H%M%S") + "_" +
                           sequence + LOG_FILE_SUFFIX;

    log_file_.open(filename, std::ios::out | std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Cannot open log file " << filename << ", logging to stderr only" << std::endl;
        current_file_.clear();
        return;
    }

    current_file_ = filename;
    prune_old_logs();
}

void SecureLogger::check_and_rotate_log() {
    if (static_cast<size_t>(log_file_.tellp()) < max_log_file_size_) {
        return;
    }
    log_file_.close();
    open_log_file();
}

void SecureLogger::prune_old_logs() {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(log_path_, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind(LOG_FILE_PREFIX, 0) == 0 &&
            entry.path().extension() == LOG_FILE_SUFFIX) {
            files.push_back(entry.path());
        }
    }
    if (ec || files.size() <= max_log_files_) {
        return;
    }

    // Timestamped names sort oldest first
    std::sort(files.begin(), files.end());
    for (size_t i = 0; i + max_log_files_ < files.size(); ++i) {
        std::filesystem::remove(files[i], ec);
    }
}

std::optional<SecureLogger::LogLevel> SecureLogger::parse_level(const std::string& name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

std::string SecureLogger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string SecureLogger::get_current_timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    char buffer[128];
    strftime(buffer, sizeof(buffer), format, &tm_now);

    return std::string(buffer);
}

} // namespace sdk
} // namespace tagattest
