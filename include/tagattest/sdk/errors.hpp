#pragma once

#include <string>

namespace tagattest {
namespace sdk {

/**
 * @brief Error codes for the TagAttest SDK
 */
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_PARAMETER,
    INTERNAL_ERROR,
    CRYPTO_INIT_FAILED,
    EMPTY_BATCH,
    INDEX_OUT_OF_RANGE,
    ENCODING_ERROR,
    KEY_COUNT_MISMATCH,
    DUPLICATE_LOGICAL_KEY,
    MALFORMED_PROOF,
    ATTESTATION_MISMATCH,
    INVALID_ATTESTATION,
    ANCHORING_UNAVAILABLE,
    NOT_FOUND,
    STORAGE_ERROR,
    COMPRESSION_FAILED,
    DECOMPRESSION_FAILED,
    PAYLOAD_TOO_LARGE,
    CONFIG_ERROR,
    THREAD_POOL_ERROR
};

/**
 * @brief Convert error code to string
 */
inline std::string ErrorCodeToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_PARAMETER: return "Invalid parameter";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        case ErrorCode::CRYPTO_INIT_FAILED: return "Crypto library initialization failed";
        case ErrorCode::EMPTY_BATCH: return "Empty batch";
        case ErrorCode::INDEX_OUT_OF_RANGE: return "Leaf index out of range";
        case ErrorCode::ENCODING_ERROR: return "Record cannot be canonicalized";
        case ErrorCode::KEY_COUNT_MISMATCH: return "Logical key count does not match leaf count";
        case ErrorCode::DUPLICATE_LOGICAL_KEY: return "Duplicate logical key";
        case ErrorCode::MALFORMED_PROOF: return "Malformed proof";
        case ErrorCode::ATTESTATION_MISMATCH: return "Attestation does not belong to tree";
        case ErrorCode::INVALID_ATTESTATION: return "Invalid attestation";
        case ErrorCode::ANCHORING_UNAVAILABLE: return "Anchoring store unavailable";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::STORAGE_ERROR: return "Storage error";
        case ErrorCode::COMPRESSION_FAILED: return "Compression failed";
        case ErrorCode::DECOMPRESSION_FAILED: return "Decompression failed";
        case ErrorCode::PAYLOAD_TOO_LARGE: return "Payload too large";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::THREAD_POOL_ERROR: return "Thread pool error";
        default: return "Unknown error";
    }
}

} // namespace sdk
} // namespace tagattest
