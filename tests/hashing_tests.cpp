#include <gtest/gtest.h>
#include "tagattest/sdk/Hashing.hpp"

using namespace tagattest::sdk;

TEST(Hashing, Sha256KnownAnswer) {
    const std::string abc = "abc";
    Digest d = Sha256::digest(reinterpret_cast<const uint8_t*>(abc.data()), abc.size());
    EXPECT_EQ(to_hex(d), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Hashing, IncrementalMatchesOneShot) {
    ByteVector data = {'a', 'b', 'c'};
    Digest incremental = Sha256().update('a').update(&data[1], 2).finalize();
    EXPECT_EQ(incremental, Sha256::digest(data.data(), data.size()));
}

TEST(Hashing, HexRoundTripAcceptsUpperCase) {
    auto bytes = from_hex("00FFa1");
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value(), (ByteVector{0x00, 0xff, 0xa1}));
    EXPECT_EQ(to_hex(bytes.value()), "00ffa1");
}

TEST(Hashing, HexRejectsBadInput) {
    EXPECT_TRUE(from_hex("abc").is_err());
    EXPECT_TRUE(from_hex("zz").is_err());
    EXPECT_TRUE(digest_from_hex("00ff").is_err());
    EXPECT_TRUE(digest_from_hex(std::string(64, 'g')).is_err());
    EXPECT_TRUE(digest_from_hex(std::string(64, 'a')).is_ok());
}

TEST(Hashing, DigestsEqual) {
    Digest a{};
    Digest b{};
    EXPECT_TRUE(digests_equal(a, b));
    b[31] = 1;
    EXPECT_FALSE(digests_equal(a, b));
}
