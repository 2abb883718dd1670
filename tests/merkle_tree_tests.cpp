#include <gtest/gtest.h>
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/LeafEncoder.hpp"
#include "tagattest/sdk/MerkleTree.hpp"
#include "tagattest/sdk/ThreadPool.hpp"

using namespace tagattest::sdk;

namespace {

std::vector<Digest> make_leaves(size_t count, const std::string& prefix = "record-") {
    std::vector<std::string> raw;
    raw.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        raw.push_back(prefix + std::to_string(i));
    }
    return LeafEncoder::encode_all(raw);
}

} // namespace

TEST(MerkleTree, EmptyBatchIsRejected) {
    auto tree = MerkleTree::build({});
    ASSERT_TRUE(tree.is_err());
    EXPECT_EQ(tree.error(), ErrorCode::EMPTY_BATCH);
}

TEST(MerkleTree, SingleLeafRootIsLeafHash) {
    Digest leaf = LeafEncoder::encode(std::string("only"));
    auto tree = MerkleTree::build({leaf});
    ASSERT_TRUE(tree.is_ok());
    EXPECT_EQ(tree.value().root_hash(), leaf);
    EXPECT_EQ(tree.value().height(), 0u);
    EXPECT_EQ(tree.value().leaf_count(), 1u);
}

TEST(MerkleTree, KnownAnswerRoots) {
    auto four = MerkleTree::build(LeafEncoder::encode_all(std::vector<std::string>{"tag1", "tag2", "tag3", "tag4"}));
    ASSERT_TRUE(four.is_ok());
    EXPECT_EQ(four.value().root_hash_hex(),
              "05de98f8dc00c712fcd02d67d942b1c93b57184989502034ff427c4a4e5b8bd2");

    auto three = MerkleTree::build(LeafEncoder::encode_all(std::vector<std::string>{"tag1", "tag2", "tag3"}));
    ASSERT_TRUE(three.is_ok());
    EXPECT_EQ(three.value().root_hash_hex(),
              "b4222c0501271d4a3e87bffb46e2198beee25492e9994a320efac933804bb8f1");

    auto five = MerkleTree::build(LeafEncoder::encode_all(std::vector<std::string>{"a", "b", "c", "d", "e"}));
    ASSERT_TRUE(five.is_ok());
    EXPECT_EQ(five.value().root_hash_hex(),
              "fe14a5426fbd70c0fa73f52342afed0da0bd23c4838662ccf6b88a3070ead97b");
}

TEST(MerkleTree, TwoLeavesHashWithNodePrefix) {
    Digest a = LeafEncoder::encode(std::string("a"));
    Digest b = LeafEncoder::encode(std::string("b"));
    auto tree = MerkleTree::build({a, b});
    ASSERT_TRUE(tree.is_ok());

    Digest expected = Sha256().update(constants::NODE_PREFIX).update(a).update(b).finalize();
    EXPECT_EQ(tree.value().root_hash(), expected);
    EXPECT_EQ(tree.value().root_hash(), MerkleTree::hash_children(a, b));
}

TEST(MerkleTree, OddNodeIsCarriedUpNotDuplicated) {
    Digest a = LeafEncoder::encode(std::string("a"));
    Digest b = LeafEncoder::encode(std::string("b"));
    Digest c = LeafEncoder::encode(std::string("c"));
    auto tree = MerkleTree::build({a, b, c});
    ASSERT_TRUE(tree.is_ok());

    EXPECT_EQ(tree.value().root_hash(), MerkleTree::hash_children(MerkleTree::hash_children(a, b), c));
    EXPECT_NE(tree.value().root_hash(),
              MerkleTree::hash_children(MerkleTree::hash_children(a, b), MerkleTree::hash_children(c, c)));
    // Three leaves plus two parents; the carried node is not copied
    EXPECT_EQ(tree.value().nodes().size(), 5u);
}

TEST(MerkleTree, DuplicateTrailingLeafChangesRoot) {
    auto three = MerkleTree::build(make_leaves(3));
    auto leaves = make_leaves(3);
    leaves.push_back(leaves.back());
    auto four = MerkleTree::build(leaves);
    ASSERT_TRUE(three.is_ok());
    ASSERT_TRUE(four.is_ok());
    EXPECT_NE(three.value().root_hash(), four.value().root_hash());
}

TEST(MerkleTree, DeterministicAcrossBuilds) {
    for (size_t n : {1u, 2u, 3u, 7u, 16u, 33u}) {
        auto first = MerkleTree::build(make_leaves(n));
        auto second = MerkleTree::build(make_leaves(n));
        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(first.value().root_hash(), second.value().root_hash()) << "n=" << n;
    }
}

TEST(MerkleTree, OrderMatters) {
    auto forward = MerkleTree::build(LeafEncoder::encode_all(std::vector<std::string>{"a", "b"}));
    auto reverse = MerkleTree::build(LeafEncoder::encode_all(std::vector<std::string>{"b", "a"}));
    EXPECT_NE(forward.value().root_hash(), reverse.value().root_hash());
}

TEST(MerkleTree, HeightIsCeilLog2) {
    EXPECT_EQ(MerkleTree::build(make_leaves(2)).value().height(), 1u);
    EXPECT_EQ(MerkleTree::build(make_leaves(3)).value().height(), 2u);
    EXPECT_EQ(MerkleTree::build(make_leaves(4)).value().height(), 2u);
    EXPECT_EQ(MerkleTree::build(make_leaves(5)).value().height(), 3u);
    EXPECT_EQ(MerkleTree::build(make_leaves(1024)).value().height(), 10u);
}

TEST(MerkleTree, LeavesKeepBatchOrder) {
    auto leaves = make_leaves(6);
    auto tree = MerkleTree::build(leaves);
    ASSERT_TRUE(tree.is_ok());
    auto listed = tree.value().leaves();
    ASSERT_EQ(listed.size(), leaves.size());
    for (size_t i = 0; i < leaves.size(); ++i) {
        EXPECT_EQ(listed[i].index, i);
        EXPECT_EQ(listed[i].hash, leaves[i]);
    }
}

TEST(MerkleTree, ParallelBuildMatchesSequential) {
    ThreadPool pool(4);
    for (size_t n : {1u, 2u, 3u, 1000u, 4097u, 10001u}) {
        auto leaves = make_leaves(n);
        auto sequential = MerkleTree::build(leaves);
        auto parallel = MerkleTree::build(leaves, &pool, 2);
        ASSERT_TRUE(sequential.is_ok());
        ASSERT_TRUE(parallel.is_ok());
        EXPECT_EQ(sequential.value().root_hash(), parallel.value().root_hash()) << "n=" << n;
        EXPECT_EQ(sequential.value().nodes().size(), parallel.value().nodes().size());
    }
}

TEST(MerkleTree, GenerateProofRejectsOutOfRangeIndex) {
    auto tree = MerkleTree::build(make_leaves(4));
    ASSERT_TRUE(tree.is_ok());
    EXPECT_EQ(tree.value().generate_proof(4).error(), ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_TRUE(tree.value().generate_proof(3).is_ok());
}

TEST(MerkleTree, CarriedLeafHasShorterPath) {
    auto tree = MerkleTree::build(make_leaves(5));
    ASSERT_TRUE(tree.is_ok());

    auto carried = tree.value().generate_proof(4);
    ASSERT_TRUE(carried.is_ok());
    EXPECT_EQ(carried.value().steps.size(), 1u);
    EXPECT_EQ(carried.value().steps[0].position, ProofPosition::LEFT);

    auto paired = tree.value().generate_proof(0);
    ASSERT_TRUE(paired.is_ok());
    EXPECT_EQ(paired.value().steps.size(), 3u);
    EXPECT_EQ(paired.value().leaf_count, 5u);
}
