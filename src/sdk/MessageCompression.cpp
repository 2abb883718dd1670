/**
 * @file MessageCompression.cpp
 * @brief zlib compression of anchored attestation payloads
 */

#include "tagattest/sdk/MessageCompression.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstring>

namespace tagattest {
namespace sdk {

namespace {
// windowBits 15 plus 16 selects gzip framing
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr size_t INFLATE_CHUNK = 16 * 1024;
}

Result<ByteVector> MessageCompression::compress(const ByteVector& data, int level) {
    if (data.empty()) {
        return ByteVector();
    }

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    if (deflateInit2(&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, 9, Z_DEFAULT_STRATEGY) != Z_OK) {
        SecureLogger::instance().error("Failed to initialize zlib deflate");
        return ErrorCode::COMPRESSION_FAILED;
    }

    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_in = const_cast<Bytef*>(data.data());

    // deflateBound accounts for the gzip header, compressBound does not
    uLong dest_len = deflateBound(&stream, static_cast<uLong>(data.size()));
    ByteVector compressed(dest_len);

    stream.avail_out = static_cast<uInt>(compressed.size());
    stream.next_out = compressed.data();

    int result = deflate(&stream, Z_FINISH);
    deflateEnd(&stream);

    if (result != Z_STREAM_END) {
        SecureLogger::instance().error("Failed to compress data: " + std::to_string(result));
        return ErrorCode::COMPRESSION_FAILED;
    }

    compressed.resize(dest_len - stream.avail_out);

    SecureLogger::instance().debug("Compressed " + std::to_string(data.size()) +
                                   " bytes to " + std::to_string(compressed.size()) + " bytes");
    return compressed;
}

Result<ByteVector> MessageCompression::decompress(const ByteVector& compressed_data, size_t max_output) {
    if (compressed_data.empty()) {
        return ByteVector();
    }

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    if (inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK) {
        SecureLogger::instance().error("Failed to initialize zlib inflate");
        return ErrorCode::DECOMPRESSION_FAILED;
    }

    stream.avail_in = static_cast<uInt>(compressed_data.size());
    stream.next_in = const_cast<Bytef*>(compressed_data.data());

    ByteVector decompressed;
    int result = Z_OK;

    while (result != Z_STREAM_END) {
        size_t total_out = decompressed.size();
        if (total_out >= max_output) {
            inflateEnd(&stream);
            SecureLogger::instance().warning("Decompressed payload exceeds " + std::to_string(max_output) + " bytes");
            return ErrorCode::PAYLOAD_TOO_LARGE;
        }

        size_t grow = std::min(INFLATE_CHUNK, max_output - total_out);
        decompressed.resize(total_out + grow);
        stream.avail_out = static_cast<uInt>(grow);
        stream.next_out = decompressed.data() + total_out;

        result = inflate(&stream, Z_NO_FLUSH);
        decompressed.resize(total_out + grow - stream.avail_out);

        if (result == Z_STREAM_END) {
            break;
        }
        // Z_BUF_ERROR with input left means the output chunk filled up
        if (result != Z_OK && !(result == Z_BUF_ERROR && stream.avail_out == 0)) {
            inflateEnd(&stream);
            SecureLogger::instance().error("Failed to decompress data: " + std::to_string(result));
            return ErrorCode::DECOMPRESSION_FAILED;
        }
        if (stream.avail_in == 0 && stream.avail_out != 0) {
            // Input exhausted without reaching the end of the stream
            inflateEnd(&stream);
            SecureLogger::instance().error("Truncated compressed payload");
            return ErrorCode::DECOMPRESSION_FAILED;
        }
    }

    inflateEnd(&stream);

    SecureLogger::instance().debug("Decompressed " + std::to_string(compressed_data.size()) +
                                   " bytes to " + std::to_string(decompressed.size()) + " bytes");
    return decompressed;
}

} // namespace sdk
} // namespace tagattest
