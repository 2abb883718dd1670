#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace tagattest {
namespace sdk {

/**
 * @brief Constants for the TagAttest SDK
 */
namespace constants {
    // Hashing constants
    constexpr size_t DIGEST_SIZE = 32;          // SHA-256 output size
    constexpr size_t DIGEST_HEX_SIZE = DIGEST_SIZE * 2;
    constexpr uint8_t LEAF_PREFIX = 0x00;       // Domain separation byte for leaves
    constexpr uint8_t NODE_PREFIX = 0x01;       // Domain separation byte for internal nodes
    constexpr uint8_t RECORD_ENCODING_VERSION = 0x01;

    // Structural limits
    constexpr size_t MAX_PROOF_DEPTH = 64;      // 2^64 leaves, never reached
    constexpr size_t MAX_RECORD_NESTING = 64;
    constexpr size_t MAX_ANCHOR_PAYLOAD_SIZE = 64 * 1024 * 1024; // 64 MB decompressed

    // Worker constants
    constexpr size_t DEFAULT_THREAD_POOL_SIZE = 4;
    constexpr size_t DEFAULT_PARALLEL_THRESHOLD = 4096; // Nodes per level before hashing in parallel
    constexpr size_t MIN_PARALLEL_CHUNK = 512;

    // Anchoring retry (owned by callers, not by the core)
    constexpr size_t DEFAULT_ANCHOR_RETRIES = 3;
    constexpr auto DEFAULT_ANCHOR_BACKOFF = std::chrono::milliseconds(200);

    // Log rotation
    constexpr size_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024; // 10 MB
    constexpr size_t MAX_LOG_FILES = 10;

    // Path constants
    const std::string LOG_PATH = "/var/log/tagattest/";
    const std::string ATTESTATION_STORE_PATH = "/var/lib/tagattest/anchors/";
    const std::string SYSTEM_CONFIG_PATH = "/etc/tagattest/tagattest.conf";
    const std::string LOCAL_CONFIG_PATH = "./tagattest.conf";
}

} // namespace sdk
} // namespace tagattest
