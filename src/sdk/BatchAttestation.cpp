/**
 * @file BatchAttestation.cpp
 * @brief Binary and JSON forms of a batch attestation
 */

#include "tagattest/sdk/BatchAttestation.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/MerkleProof.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace tagattest {
namespace sdk {

namespace pt = boost::property_tree;

namespace {

constexpr uint8_t ATTESTATION_FORMAT_VERSION = 0x01;

void put_u32(ByteVector& out, uint32_t v) {
    for (int i = 3; i >= 0; i--) {
        out.push_back((v >> (i * 8)) & 0xFF);
    }
}

void put_u64(ByteVector& out, uint64_t v) {
    for (int i = 7; i >= 0; i--) {
        out.push_back((v >> (i * 8)) & 0xFF);
    }
}

void put_string(ByteVector& out, const std::string& s) {
    put_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : days[month - 1];
}

int64_t to_millis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

} // namespace

std::string format_timestamp(TimePoint time) {
    int64_t millis = to_millis(time);
    int64_t seconds = millis / 1000;
    int64_t remainder = millis % 1000;
    if (remainder < 0) {
        remainder += 1000;
        seconds -= 1;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);

    char buffer[64];
    size_t len = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    std::snprintf(buffer + len, sizeof(buffer) - len, ".%03dZ", static_cast<int>(remainder));
    return std::string(buffer);
}

std::optional<TimePoint> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
        consumed != 19) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (size_t d = digits; d < 3; ++d) {
            millis *= 10;
        }
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') {
        return std::nullopt;
    }

    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    tm_utc.tm_hour = hour;
    tm_utc.tm_min = minute;
    tm_utc.tm_sec = second;
    std::time_t seconds = timegm(&tm_utc);

    return TimePoint(std::chrono::seconds(seconds)) + std::chrono::milliseconds(millis);
}

Result<void> BatchAttestation::build_key_index() {
    key_index.clear();
    key_index.reserve(records.size());
    for (const auto& record : records) {
        if (!key_index.emplace(record.logical_key, record.index).second) {
            SecureLogger::instance().warning("Duplicate logical key in batch: " + record.logical_key);
            key_index.clear();
            return ErrorCode::DUPLICATE_LOGICAL_KEY;
        }
    }
    return ErrorCode::SUCCESS;
}

std::optional<size_t> BatchAttestation::find_index(const std::string& logical_key) const {
    auto it = key_index.find(logical_key);
    if (it == key_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

ByteVector BatchAttestation::serialize() const {
    ByteVector result;
    result.push_back(ATTESTATION_FORMAT_VERSION);
    result.insert(result.end(), root_hash.begin(), root_hash.end());
    put_u64(result, record_count);
    put_u64(result, static_cast<uint64_t>(to_millis(created_at)));

    put_u32(result, static_cast<uint32_t>(records.size()));
    for (const auto& record : records) {
        put_string(result, record.logical_key);
        put_u64(result, record.index);
    }

    put_u32(result, static_cast<uint32_t>(metadata.size()));
    for (const auto& [key, value] : metadata) {
        put_string(result, key);
        put_string(result, value);
    }

    return result;
}

std::string BatchAttestation::attestation_id() const {
    ByteVector bytes = serialize();
    return to_hex(Sha256::digest(bytes.data(), bytes.size()));
}

pt::ptree BatchAttestation::to_ptree() const {
    pt::ptree root;
    root.put("rootHash", to_hex(root_hash));
    root.put("recordCount", record_count);
    root.put("createdAt", format_timestamp(created_at));

    pt::ptree records_array;
    for (const auto& record : records) {
        pt::ptree record_node;
        record_node.put("logicalKey", record.logical_key);
        record_node.put("index", record.index);
        records_array.push_back(std::make_pair("", record_node));
    }
    root.add_child("records", records_array);

    if (!metadata.empty()) {
        pt::ptree metadata_node;
        for (const auto& [key, value] : metadata) {
            // Keys may contain '.', so bypass path parsing
            metadata_node.push_back(std::make_pair(key, pt::ptree(value)));
        }
        root.add_child("metadata", metadata_node);
    }

    return root;
}

std::string BatchAttestation::to_json(bool pretty) const {
    std::ostringstream oss;
    pt::write_json(oss, to_ptree(), pretty);
    return oss.str();
}

Result<BatchAttestation> BatchAttestation::from_ptree(const pt::ptree& tree) {
    try {
        BatchAttestation attestation;

        auto root = digest_from_hex(tree.get<std::string>("rootHash"));
        if (root.is_err()) {
            SecureLogger::instance().warning("Attestation root hash is not a 32-byte hex digest");
            return ErrorCode::INVALID_ATTESTATION;
        }
        attestation.root_hash = root.value();
        auto record_count = get_unsigned(tree, "recordCount");
        if (!record_count) {
            SecureLogger::instance().warning("Attestation recordCount is not a non-negative integer");
            return ErrorCode::INVALID_ATTESTATION;
        }
        attestation.record_count = *record_count;

        auto created_at = parse_timestamp(tree.get<std::string>("createdAt"));
        if (!created_at) {
            SecureLogger::instance().warning("Attestation createdAt is not an ISO-8601 UTC timestamp");
            return ErrorCode::INVALID_ATTESTATION;
        }
        attestation.created_at = *created_at;

        for (const auto& item : tree.get_child("records")) {
            AttestedRecord record;
            record.logical_key = item.second.get<std::string>("logicalKey");
            auto index = get_unsigned(item.second, "index");
            if (!index) {
                SecureLogger::instance().warning("Attestation record index is not a non-negative integer");
                return ErrorCode::INVALID_ATTESTATION;
            }
            record.index = static_cast<size_t>(*index);
            attestation.records.push_back(record);
        }

        if (auto metadata_node = tree.get_child_optional("metadata")) {
            for (const auto& item : *metadata_node) {
                attestation.metadata[item.first] = item.second.data();
            }
        }

        if (attestation.records.empty() || attestation.records.size() != attestation.record_count) {
            SecureLogger::instance().warning("Attestation record count does not match its records");
            return ErrorCode::INVALID_ATTESTATION;
        }
        for (size_t i = 0; i < attestation.records.size(); ++i) {
            if (attestation.records[i].index != i) {
                SecureLogger::instance().warning("Attestation records are not in leaf order");
                return ErrorCode::INVALID_ATTESTATION;
            }
        }
        if (attestation.build_key_index().is_err()) {
            return ErrorCode::INVALID_ATTESTATION;
        }

        return attestation;
    } catch (const pt::ptree_error& e) {
        SecureLogger::instance().warning("Rejected attestation: " + std::string(e.what()));
        return ErrorCode::INVALID_ATTESTATION;
    }
}

Result<BatchAttestation> BatchAttestation::from_json(const std::string& json) {
    pt::ptree tree;
    try {
        std::istringstream iss(json);
        pt::read_json(iss, tree);
    } catch (const pt::json_parser_error& e) {
        SecureLogger::instance().warning("Attestation is not valid JSON: " + std::string(e.what()));
        return ErrorCode::INVALID_ATTESTATION;
    }
    return from_ptree(tree);
}

bool BatchAttestation::operator==(const BatchAttestation& other) const {
    return root_hash == other.root_hash &&
           record_count == other.record_count &&
           to_millis(created_at) == to_millis(other.created_at) &&
           records == other.records &&
           metadata == other.metadata;
}

} // namespace sdk
} // namespace tagattest
