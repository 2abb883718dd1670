/**
 * @file Hashing.cpp
 * @brief SHA-256 and hex codec helpers backed by libsodium
 */

#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <algorithm>
#include <stdexcept>

namespace tagattest {
namespace sdk {

Result<void> initialize_crypto() {
    static const int init_result = sodium_init();
    if (init_result < 0) {
        SecureLogger::instance().critical("libsodium initialization failed");
        return ErrorCode::CRYPTO_INIT_FAILED;
    }
    return ErrorCode::SUCCESS;
}

Sha256::Sha256() {
    if (initialize_crypto().is_err()) {
        throw std::runtime_error("libsodium unavailable");
    }
    crypto_hash_sha256_init(&state_);
}

Sha256& Sha256::update(const uint8_t* data, size_t size) {
    if (size > 0) {
        crypto_hash_sha256_update(&state_, data, size);
    }
    return *this;
}

Digest Sha256::finalize() {
    Digest out;
    crypto_hash_sha256_final(&state_, out.data());
    return out;
}

Digest Sha256::digest(const uint8_t* data, size_t size) {
    return Sha256().update(data, size).finalize();
}

std::string to_hex(const uint8_t* data, size_t size) {
    std::string hex(size * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), data, size);
    hex.resize(size * 2);
    return hex;
}

std::string to_hex(const ByteVector& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

std::string to_hex(const Digest& digest) {
    return to_hex(digest.data(), digest.size());
}

Result<ByteVector> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return ErrorCode::INVALID_PARAMETER;
    }

    ByteVector bytes(hex.size() / 2);
    size_t bin_len = 0;
    const char* hex_end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &hex_end) != 0 ||
        hex_end != hex.data() + hex.size()) {
        return ErrorCode::INVALID_PARAMETER;
    }

    bytes.resize(bin_len);
    return bytes;
}

Result<Digest> digest_from_hex(const std::string& hex) {
    if (hex.size() != constants::DIGEST_HEX_SIZE) {
        return ErrorCode::INVALID_PARAMETER;
    }

    auto bytes = from_hex(hex);
    if (bytes.is_err()) {
        return bytes.error();
    }

    Digest digest;
    std::copy(bytes.value().begin(), bytes.value().end(), digest.begin());
    return digest;
}

bool digests_equal(const Digest& a, const Digest& b) {
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace sdk
} // namespace tagattest
