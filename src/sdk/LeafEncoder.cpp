#include "tagattest/sdk/LeafEncoder.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace tagattest {
namespace sdk {

namespace {

enum ValueTag : uint8_t {
    TAG_NULL = 0x00,
    TAG_FALSE = 0x01,
    TAG_TRUE = 0x02,
    TAG_INTEGER = 0x03,
    TAG_DOUBLE = 0x04,
    TAG_STRING = 0x05,
    TAG_ARRAY = 0x06,
    TAG_OBJECT = 0x07
};

void put_u32(ByteVector& out, uint32_t v) {
    out.push_back((v >> 24) & 0xFF);
    out.push_back((v >> 16) & 0xFF);
    out.push_back((v >> 8) & 0xFF);
    out.push_back(v & 0xFF);
}

void put_u64(ByteVector& out, uint64_t v) {
    for (int i = 7; i >= 0; i--) {
        out.push_back((v >> (i * 8)) & 0xFF);
    }
}

bool put_string(ByteVector& out, const std::string& s) {
    if (s.size() > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    put_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
    return true;
}

// Returns false when the value has no canonical form
bool put_value(ByteVector& out, const RecordValue& value, size_t depth) {
    if (depth > constants::MAX_RECORD_NESTING) {
        SecureLogger::instance().warning("Record nesting exceeds " +
                                         std::to_string(constants::MAX_RECORD_NESTING));
        return false;
    }

    switch (value.type()) {
        case RecordValue::Type::NULL_VALUE:
            out.push_back(TAG_NULL);
            return true;

        case RecordValue::Type::BOOLEAN:
            out.push_back(value.as_bool() ? TAG_TRUE : TAG_FALSE);
            return true;

        case RecordValue::Type::INTEGER:
            out.push_back(TAG_INTEGER);
            put_u64(out, static_cast<uint64_t>(value.as_integer()));
            return true;

        case RecordValue::Type::DOUBLE: {
            double d = value.as_double();
            if (!std::isfinite(d)) {
                SecureLogger::instance().warning("Record contains a non-finite number");
                return false;
            }
            if (d == 0.0) {
                d = 0.0;
            }
            uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(bits));
            out.push_back(TAG_DOUBLE);
            put_u64(out, bits);
            return true;
        }

        case RecordValue::Type::STRING:
            out.push_back(TAG_STRING);
            return put_string(out, value.as_string());

        case RecordValue::Type::ARRAY: {
            const auto& items = value.as_array();
            if (items.size() > std::numeric_limits<uint32_t>::max()) {
                return false;
            }
            out.push_back(TAG_ARRAY);
            put_u32(out, static_cast<uint32_t>(items.size()));
            for (const auto& item : items) {
                if (!put_value(out, item, depth + 1)) {
                    return false;
                }
            }
            return true;
        }

        case RecordValue::Type::OBJECT: {
            const auto& fields = value.as_object();
            if (fields.size() > std::numeric_limits<uint32_t>::max()) {
                return false;
            }

            std::vector<const std::pair<std::string, RecordValue>*> sorted;
            sorted.reserve(fields.size());
            for (const auto& field : fields) {
                sorted.push_back(&field);
            }
            std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) {
                return a->first < b->first;
            });

            for (size_t i = 1; i < sorted.size(); ++i) {
                if (sorted[i - 1]->first == sorted[i]->first) {
                    SecureLogger::instance().warning("Record object has duplicate key: " + sorted[i]->first);
                    return false;
                }
            }

            out.push_back(TAG_OBJECT);
            put_u32(out, static_cast<uint32_t>(sorted.size()));
            for (const auto* field : sorted) {
                if (!put_string(out, field->first) || !put_value(out, field->second, depth + 1)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

} // namespace

Digest LeafEncoder::hash_leaf(const uint8_t* data, size_t size) {
    return Sha256().update(constants::LEAF_PREFIX).update(data, size).finalize();
}

Digest LeafEncoder::encode(const ByteVector& raw) {
    return hash_leaf(raw.data(), raw.size());
}

Digest LeafEncoder::encode(const std::string& raw) {
    return hash_leaf(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

Result<ByteVector> LeafEncoder::canonicalize(const TagRecord& record) {
    ByteVector out;
    out.push_back(constants::RECORD_ENCODING_VERSION);
    if (!put_string(out, record.uid) || !put_value(out, record.data, 0)) {
        SecureLogger::instance().warning("Cannot canonicalize record for tag " + record.uid);
        return ErrorCode::ENCODING_ERROR;
    }
    return out;
}

Result<Digest> LeafEncoder::encode(const TagRecord& record) {
    auto canonical = canonicalize(record);
    if (canonical.is_err()) {
        return canonical.error();
    }
    return hash_leaf(canonical.value().data(), canonical.value().size());
}

std::vector<Digest> LeafEncoder::encode_all(const std::vector<std::string>& raw_records) {
    std::vector<Digest> digests;
    digests.reserve(raw_records.size());
    for (const auto& raw : raw_records) {
        digests.push_back(encode(raw));
    }
    return digests;
}

Result<std::vector<Digest>> LeafEncoder::encode_all(const std::vector<TagRecord>& records) {
    std::vector<Digest> digests;
    digests.reserve(records.size());
    for (const auto& record : records) {
        auto digest = encode(record);
        if (digest.is_err()) {
            return digest.error();
        }
        digests.push_back(digest.value());
    }
    return digests;
}

} // namespace sdk
} // namespace tagattest
