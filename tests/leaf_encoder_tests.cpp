#include <gtest/gtest.h>
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/LeafEncoder.hpp"
#include <limits>

using namespace tagattest::sdk;

TEST(LeafEncoder, RawStringKnownAnswer) {
    EXPECT_EQ(to_hex(LeafEncoder::encode(std::string("tag1"))),
              "e8d257a89feb073134a9eea3669a2966cc1e15724633644fb42616908138f83c");
    EXPECT_EQ(to_hex(LeafEncoder::encode(std::string())),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST(LeafEncoder, BytesAndStringAgree) {
    ByteVector bytes = {'t', 'a', 'g', '1'};
    EXPECT_EQ(LeafEncoder::encode(bytes), LeafEncoder::encode(std::string("tag1")));
}

TEST(LeafEncoder, LeafHashIsDomainSeparated) {
    const std::string data = "tag1";
    Digest plain = Sha256::digest(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    EXPECT_NE(LeafEncoder::encode(data), plain);
}

TEST(LeafEncoder, CanonicalRecordLayout) {
    TagRecord record{"04A1", RecordValue::object({{"b", true}, {"a", 1}})};
    auto canonical = LeafEncoder::canonicalize(record);
    ASSERT_TRUE(canonical.is_ok());
    EXPECT_EQ(to_hex(canonical.value()),
              "01000000043034413107000000020000000161030000000000000001000000016202");

    auto digest = LeafEncoder::encode(record);
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(to_hex(digest.value()),
              "f3bae7403f1c7dae8043875771a41e3de6af5c124ed3f9d0c7875899a586ffb7");
}

TEST(LeafEncoder, ObjectKeyOrderDoesNotMatter) {
    TagRecord a{"uid", RecordValue::object({{"sku", "X-1"}, {"lot", 7}, {"ok", true}})};
    TagRecord b{"uid", RecordValue::object({{"ok", true}, {"sku", "X-1"}, {"lot", 7}})};
    EXPECT_EQ(LeafEncoder::encode(a).value(), LeafEncoder::encode(b).value());
}

TEST(LeafEncoder, ArrayOrderMatters) {
    TagRecord a{"uid", RecordValue::array({1, 2})};
    TagRecord b{"uid", RecordValue::array({2, 1})};
    EXPECT_NE(LeafEncoder::encode(a).value(), LeafEncoder::encode(b).value());
}

TEST(LeafEncoder, TypesAreDistinguished) {
    TagRecord as_int{"uid", RecordValue(1)};
    TagRecord as_double{"uid", RecordValue(1.0)};
    TagRecord as_string{"uid", RecordValue("1")};
    TagRecord as_bool{"uid", RecordValue(true)};
    EXPECT_NE(LeafEncoder::encode(as_int).value(), LeafEncoder::encode(as_double).value());
    EXPECT_NE(LeafEncoder::encode(as_int).value(), LeafEncoder::encode(as_string).value());
    EXPECT_NE(LeafEncoder::encode(as_int).value(), LeafEncoder::encode(as_bool).value());
}

TEST(LeafEncoder, UidIsPartOfTheLeaf) {
    TagRecord a{"uid-a", RecordValue("same")};
    TagRecord b{"uid-b", RecordValue("same")};
    EXPECT_NE(LeafEncoder::encode(a).value(), LeafEncoder::encode(b).value());
}

TEST(LeafEncoder, NegativeZeroIsNormalized) {
    TagRecord pos{"uid", RecordValue(0.0)};
    TagRecord neg{"uid", RecordValue(-0.0)};
    EXPECT_EQ(LeafEncoder::encode(pos).value(), LeafEncoder::encode(neg).value());
}

TEST(LeafEncoder, RejectsNonFiniteNumbers) {
    TagRecord nan{"uid", RecordValue(std::numeric_limits<double>::quiet_NaN())};
    TagRecord inf{"uid", RecordValue(std::numeric_limits<double>::infinity())};
    EXPECT_EQ(LeafEncoder::encode(nan).error(), ErrorCode::ENCODING_ERROR);
    EXPECT_EQ(LeafEncoder::encode(inf).error(), ErrorCode::ENCODING_ERROR);
}

TEST(LeafEncoder, RejectsDuplicateObjectKeys) {
    TagRecord record{"uid", RecordValue::object({{"k", 1}, {"k", 2}})};
    EXPECT_EQ(LeafEncoder::encode(record).error(), ErrorCode::ENCODING_ERROR);
}

TEST(LeafEncoder, RejectsExcessiveNesting) {
    RecordValue value("leaf");
    for (size_t i = 0; i <= constants::MAX_RECORD_NESTING; ++i) {
        value = RecordValue::array({value});
    }
    TagRecord record{"uid", value};
    EXPECT_EQ(LeafEncoder::encode(record).error(), ErrorCode::ENCODING_ERROR);
}

TEST(LeafEncoder, EncodeAllStopsAtFirstBadRecord) {
    std::vector<TagRecord> records = {
        {"a", RecordValue(1)},
        {"b", RecordValue(std::numeric_limits<double>::infinity())},
    };
    EXPECT_EQ(LeafEncoder::encode_all(records).error(), ErrorCode::ENCODING_ERROR);

    records.pop_back();
    auto digests = LeafEncoder::encode_all(records);
    ASSERT_TRUE(digests.is_ok());
    EXPECT_EQ(digests.value().size(), 1u);
}
