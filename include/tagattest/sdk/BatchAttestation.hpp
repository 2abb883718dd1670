#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <boost/property_tree/ptree.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tagattest {
namespace sdk {

/**
 * @brief Position of one business key within an attested batch
 */
struct AttestedRecord {
    std::string logical_key;
    size_t index = 0;

    bool operator==(const AttestedRecord& other) const {
        return logical_key == other.logical_key && index == other.index;
    }
};

/**
 * @brief Publishable commitment to one batch: root hash plus metadata
 *
 * This is the only artifact handed to an AnchoringClient. created_at is
 * kept at millisecond precision so it survives the JSON form unchanged.
 */
struct BatchAttestation {
    Digest root_hash{};
    uint64_t record_count = 0;
    TimePoint created_at{};
    std::vector<AttestedRecord> records;
    std::map<std::string, std::string> metadata;

    // Derived from records by build_key_index()
    std::unordered_map<std::string, size_t> key_index;

    // Rebuild key_index; DUPLICATE_LOGICAL_KEY if a key repeats
    Result<void> build_key_index();

    std::optional<size_t> find_index(const std::string& logical_key) const;

    /**
     * @brief Canonical binary form
     *
     * version | root (32) | record_count u64 | created_at ms u64 |
     * u32 n, n x (u32 len, key, u64 index) | u32 m, m x (key, value)
     * with big-endian integers and metadata in key order.
     */
    ByteVector serialize() const;

    // Hex SHA-256 of serialize()
    std::string attestation_id() const;

    boost::property_tree::ptree to_ptree() const;
    std::string to_json(bool pretty = true) const;

    // Fails with INVALID_ATTESTATION on missing fields or inconsistent records
    static Result<BatchAttestation> from_ptree(const boost::property_tree::ptree& tree);
    static Result<BatchAttestation> from_json(const std::string& json);

    bool operator==(const BatchAttestation& other) const;
};

// ISO-8601 UTC with milliseconds, e.g. 2026-10-19T06:38:12.123Z
std::string format_timestamp(TimePoint time);
std::optional<TimePoint> parse_timestamp(const std::string& text);

} // namespace sdk
} // namespace tagattest
