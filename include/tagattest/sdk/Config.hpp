#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <optional>
#include <string>

namespace tagattest {
namespace sdk {

/**
 * @brief Runtime settings for the tagattest tool
 */
struct AttestConfig {
    std::string log_path;               // Empty logs to stderr only
    std::string log_level = "info";
    std::string store_path = constants::ATTESTATION_STORE_PATH;
    size_t hash_threads = constants::DEFAULT_THREAD_POOL_SIZE;
    size_t parallel_threshold = constants::DEFAULT_PARALLEL_THRESHOLD;
    size_t anchor_retries = constants::DEFAULT_ANCHOR_RETRIES;
    size_t anchor_backoff_ms = static_cast<size_t>(constants::DEFAULT_ANCHOR_BACKOFF.count());
};

/**
 * @brief Read "key = value" lines into a config seeded with defaults
 *
 * Blank lines and lines starting with '#' are skipped. Unknown keys,
 * lines without '=', bad numbers and unknown log levels fail with
 * CONFIG_ERROR; a missing file is NOT_FOUND.
 */
Result<AttestConfig> load_config(const std::string& path);

// Apply one setting; CONFIG_ERROR when the key or value is not accepted
Result<void> apply_config_value(AttestConfig& config, const std::string& key, const std::string& value);

// First existing file among the default config locations
std::optional<std::string> find_default_config();

} // namespace sdk
} // namespace tagattest
