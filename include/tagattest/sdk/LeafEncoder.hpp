#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "RecordValue.hpp"
#include <string>
#include <vector>

namespace tagattest {
namespace sdk {

/**
 * @brief Canonicalizes records and hashes them into leaf digests
 *
 * Leaf hash is SHA-256(0x00 || canonical bytes). Raw byte strings and
 * plain strings are their own canonical form. Tag records use encoding
 * version 1:
 *
 *   0x01 | string(uid) | value(data)
 *
 * where a value is a type tag followed by its body:
 *
 *   0x00 null | 0x01 false | 0x02 true
 *   0x03 int64, 8 bytes big-endian
 *   0x04 double, IEEE-754 bits big-endian, -0.0 written as 0.0
 *   0x05 string: u32 big-endian length, bytes
 *   0x06 array: u32 count, values
 *   0x07 object: u32 count, (string key, value) sorted by key bytes
 */
class LeafEncoder {
public:
    // Hash already-canonical bytes as a leaf
    static Digest hash_leaf(const uint8_t* data, size_t size);

    static Digest encode(const ByteVector& raw);
    static Digest encode(const std::string& raw);

    // Fails with ENCODING_ERROR when the record cannot be canonicalized
    static Result<Digest> encode(const TagRecord& record);

    static Result<ByteVector> canonicalize(const TagRecord& record);

    static std::vector<Digest> encode_all(const std::vector<std::string>& raw_records);
    static Result<std::vector<Digest>> encode_all(const std::vector<TagRecord>& records);
};

} // namespace sdk
} // namespace tagattest
