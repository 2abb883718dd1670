#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <sodium.h>
#include <string>

namespace tagattest {
namespace sdk {

/**
 * @brief Initialize libsodium once per process
 *
 * Safe to call from any thread and any number of times.
 */
Result<void> initialize_crypto();

/**
 * @brief Incremental SHA-256 over libsodium's crypto_hash_sha256
 */
class Sha256 {
public:
    Sha256();

    Sha256& update(const uint8_t* data, size_t size);
    Sha256& update(const ByteVector& data) { return update(data.data(), data.size()); }
    Sha256& update(const Digest& data) { return update(data.data(), data.size()); }
    Sha256& update(uint8_t byte) { return update(&byte, 1); }

    Digest finalize();

    // One-shot helper
    static Digest digest(const uint8_t* data, size_t size);

private:
    crypto_hash_sha256_state state_;
};

// Hex helpers (lowercase output, either case accepted on input)
std::string to_hex(const uint8_t* data, size_t size);
std::string to_hex(const ByteVector& bytes);
std::string to_hex(const Digest& digest);
Result<ByteVector> from_hex(const std::string& hex);
Result<Digest> digest_from_hex(const std::string& hex);

// Constant-time digest comparison
bool digests_equal(const Digest& a, const Digest& b);

} // namespace sdk
} // namespace tagattest
