#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <zlib.h>

namespace tagattest {
namespace sdk {

/**
 * @brief gzip-framed zlib compression for anchored payloads
 */
class MessageCompression {
public:
    // Compress data using zlib with a gzip header
    static Result<ByteVector> compress(const ByteVector& data, int level = Z_BEST_COMPRESSION);

    // Decompress data; output larger than max_output fails with PAYLOAD_TOO_LARGE
    static Result<ByteVector> decompress(const ByteVector& compressed_data,
                                         size_t max_output = constants::MAX_ANCHOR_PAYLOAD_SIZE);
};

} // namespace sdk
} // namespace tagattest
