#include <gtest/gtest.h>
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/LeafEncoder.hpp"
#include "tagattest/sdk/TagBatch.hpp"
#include "tagattest/sdk/ThreadPool.hpp"
#include <limits>

using namespace tagattest::sdk;

namespace {

std::vector<TagRecord> make_tags(size_t count) {
    std::vector<TagRecord> tags;
    for (size_t i = 0; i < count; ++i) {
        tags.push_back({"04:A2:" + std::to_string(i),
                        RecordValue::object({{"product", "bottle"},
                                             {"serial", static_cast<int64_t>(1000 + i)},
                                             {"sealed", true}})});
    }
    return tags;
}

} // namespace

TEST(TagBatch, CreateAndProveEveryTag) {
    auto tags = make_tags(9);
    auto batch = TagBatch::create(tags, nullptr, {{"line", "A"}});
    ASSERT_TRUE(batch.is_ok());

    const TagBatch& b = batch.value();
    EXPECT_EQ(b.size(), 9u);
    EXPECT_EQ(b.attestation().record_count, 9u);
    EXPECT_EQ(b.attestation().root_hash, b.root_hash());
    EXPECT_EQ(b.attestation().metadata.at("line"), "A");

    for (size_t i = 0; i < tags.size(); ++i) {
        auto proof = b.generate_tag_proof(tags[i].uid);
        ASSERT_TRUE(proof.is_ok());
        ASSERT_TRUE(proof.value().has_value());
        EXPECT_EQ(proof.value()->index, i);
        EXPECT_TRUE(b.verify_tag(tags[i].uid, proof.value()->proof, proof.value()->index, b.root_hash()));
    }
}

TEST(TagBatch, RootMatchesEncodedRecords) {
    auto tags = make_tags(4);
    auto batch = TagBatch::create(tags);
    ASSERT_TRUE(batch.is_ok());

    auto leaves = LeafEncoder::encode_all(tags);
    ASSERT_TRUE(leaves.is_ok());
    auto tree = MerkleTree::build(leaves.value());
    ASSERT_TRUE(tree.is_ok());
    EXPECT_EQ(batch.value().root_hash(), tree.value().root_hash());
}

TEST(TagBatch, UnknownUidYieldsNoProofAndFailsVerification) {
    auto batch = TagBatch::create(make_tags(3)).take();

    auto proof = batch.generate_tag_proof("FF:FF");
    ASSERT_TRUE(proof.is_ok());
    EXPECT_FALSE(proof.value().has_value());

    auto known = batch.generate_tag_proof("04:A2:0").take();
    ASSERT_TRUE(known.has_value());
    EXPECT_FALSE(batch.verify_tag("FF:FF", known->proof, known->index, batch.root_hash()));
}

TEST(TagBatch, ProofForOneTagDoesNotVerifyAnother) {
    auto batch = TagBatch::create(make_tags(5)).take();
    auto proof = batch.generate_tag_proof("04:A2:1").take();
    ASSERT_TRUE(proof.has_value());

    EXPECT_FALSE(batch.verify_tag("04:A2:2", proof->proof, proof->index, batch.root_hash()));
    EXPECT_FALSE(batch.verify_tag("04:A2:1", proof->proof, proof->index + 1, batch.root_hash()));
    EXPECT_FALSE(batch.verify_tag("04:A2:1", proof->proof, proof->index, Digest{}));
}

TEST(TagBatch, MalformedProofIsFalse) {
    auto batch = TagBatch::create(make_tags(2)).take();
    MerkleProof bogus;
    bogus.leaf_count = 0;
    EXPECT_FALSE(batch.verify_tag("04:A2:0", bogus, 0, batch.root_hash()));
}

TEST(TagBatch, InvalidBatchesAreRejected) {
    EXPECT_EQ(TagBatch::create({}).error(), ErrorCode::EMPTY_BATCH);

    auto duplicate = make_tags(3);
    duplicate[2].uid = duplicate[0].uid;
    EXPECT_EQ(TagBatch::create(duplicate).error(), ErrorCode::DUPLICATE_LOGICAL_KEY);

    auto unencodable = make_tags(2);
    unencodable[1].data = RecordValue(std::numeric_limits<double>::quiet_NaN());
    EXPECT_EQ(TagBatch::create(unencodable).error(), ErrorCode::ENCODING_ERROR);
}

TEST(TagBatch, DefaultConstructedBatchHasNoProofs) {
    TagBatch empty;
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_EQ(empty.root_hash(), Digest{});

    auto proof = empty.generate_tag_proof("NO-SUCH-KEY");
    ASSERT_TRUE(proof.is_err());
    EXPECT_EQ(proof.error(), ErrorCode::EMPTY_BATCH);
    EXPECT_FALSE(empty.verify_tag("NO-SUCH-KEY", MerkleProof{1, {}}, 0, Digest{}));
}

TEST(TagBatch, ParallelBatchMatchesSequential) {
    ThreadPool pool(3);
    auto tags = make_tags(5000);
    auto sequential = TagBatch::create(tags);
    auto parallel = TagBatch::create(tags, &pool);
    ASSERT_TRUE(sequential.is_ok());
    ASSERT_TRUE(parallel.is_ok());
    EXPECT_EQ(sequential.value().root_hash(), parallel.value().root_hash());
}
