#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tagattest {
namespace sdk {

/**
 * @brief Structured record value (JSON-like) attached to a tag
 *
 * Objects keep the caller's insertion order; the leaf encoder sorts keys
 * when canonicalizing, so order never affects a leaf hash.
 */
class RecordValue {
public:
    enum class Type {
        NULL_VALUE,
        BOOLEAN,
        INTEGER,
        DOUBLE,
        STRING,
        ARRAY,
        OBJECT
    };

    using Array = std::vector<RecordValue>;
    using Object = std::vector<std::pair<std::string, RecordValue>>;

    RecordValue() : value_(std::monostate{}) {}
    RecordValue(bool value) : value_(value) {}
    RecordValue(int value) : value_(static_cast<int64_t>(value)) {}
    RecordValue(int64_t value) : value_(value) {}
    RecordValue(double value) : value_(value) {}
    RecordValue(const char* value) : value_(std::string(value)) {}
    RecordValue(std::string value) : value_(std::move(value)) {}
    RecordValue(Array value) : value_(std::move(value)) {}
    RecordValue(Object value) : value_(std::move(value)) {}

    static RecordValue array(Array items) { return RecordValue(std::move(items)); }
    static RecordValue object(Object fields) { return RecordValue(std::move(fields)); }

    Type type() const { return static_cast<Type>(value_.index()); }
    bool is_null() const { return type() == Type::NULL_VALUE; }

    // Accessors throw std::bad_variant_access on type mismatch
    bool as_bool() const { return std::get<bool>(value_); }
    int64_t as_integer() const { return std::get<int64_t>(value_); }
    double as_double() const { return std::get<double>(value_); }
    const std::string& as_string() const { return std::get<std::string>(value_); }
    const Array& as_array() const { return std::get<Array>(value_); }
    const Object& as_object() const { return std::get<Object>(value_); }

    bool operator==(const RecordValue& other) const { return value_ == other.value_; }
    bool operator!=(const RecordValue& other) const { return !(*this == other); }

private:
    // Alternative order matches Type
    std::variant<std::monostate, bool, int64_t, double, std::string, Array, Object> value_;
};

/**
 * @brief One tag in a batch: business key plus its metadata
 */
struct TagRecord {
    std::string uid;
    RecordValue data;
};

} // namespace sdk
} // namespace tagattest
