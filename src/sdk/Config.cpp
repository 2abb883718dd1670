#include "tagattest/sdk/Config.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

namespace tagattest {
namespace sdk {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool parse_size(const std::string& value, size_t& out) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

Result<void> apply_config_value(AttestConfig& config, const std::string& key, const std::string& value) {
    size_t number = 0;

    if (key == "log_path") {
        config.log_path = value;
    } else if (key == "log_level") {
        if (!SecureLogger::parse_level(value)) {
            SecureLogger::instance().error("Unknown log level: " + value);
            return ErrorCode::CONFIG_ERROR;
        }
        config.log_level = value;
    } else if (key == "store_path") {
        if (value.empty()) {
            SecureLogger::instance().error("store_path must not be empty");
            return ErrorCode::CONFIG_ERROR;
        }
        config.store_path = value;
    } else if (key == "hash_threads" || key == "parallel_threshold" ||
               key == "anchor_retries" || key == "anchor_backoff_ms") {
        if (!parse_size(value, number)) {
            SecureLogger::instance().error("Invalid number for " + key + ": " + value);
            return ErrorCode::CONFIG_ERROR;
        }
        if (key == "hash_threads") {
            if (number == 0) {
                SecureLogger::instance().error("hash_threads must be at least 1");
                return ErrorCode::CONFIG_ERROR;
            }
            config.hash_threads = number;
        } else if (key == "parallel_threshold") {
            config.parallel_threshold = number;
        } else if (key == "anchor_retries") {
            config.anchor_retries = number;
        } else {
            config.anchor_backoff_ms = number;
        }
    } else {
        SecureLogger::instance().error("Unknown configuration key: " + key);
        return ErrorCode::CONFIG_ERROR;
    }

    return ErrorCode::SUCCESS;
}

Result<AttestConfig> load_config(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file) {
        SecureLogger::instance().error("Cannot open configuration file: " + path);
        return ErrorCode::NOT_FOUND;
    }

    AttestConfig config;
    std::string line;
    size_t line_number = 0;

    while (std::getline(config_file, line)) {
        ++line_number;
        line = trim(line);
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            SecureLogger::instance().error(path + ":" + std::to_string(line_number) + ": expected key = value");
            return ErrorCode::CONFIG_ERROR;
        }

        auto applied = apply_config_value(config, trim(line.substr(0, pos)), trim(line.substr(pos + 1)));
        if (applied.is_err()) {
            SecureLogger::instance().error(path + ":" + std::to_string(line_number) + ": rejected");
            return applied.error();
        }
    }

    SecureLogger::instance().debug("Loaded configuration from " + path);
    return config;
}

std::optional<std::string> find_default_config() {
    const std::vector<std::string> config_paths = {
        constants::SYSTEM_CONFIG_PATH,
        constants::LOCAL_CONFIG_PATH,
    };

    for (const auto& path : config_paths) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

} // namespace sdk
} // namespace tagattest
