/**
 * @file MerkleTree.cpp
 * @brief Level-by-level tree construction and audit path generation
 */

#include "tagattest/sdk/MerkleTree.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include "tagattest/sdk/ThreadPool.hpp"
#include <chrono>

namespace tagattest {
namespace sdk {

Digest MerkleTree::hash_children(const Digest& left, const Digest& right) {
    return Sha256().update(constants::NODE_PREFIX).update(left).update(right).finalize();
}

Result<MerkleTree> MerkleTree::build(const std::vector<Digest>& leaf_hashes,
                                     ThreadPool* pool,
                                     size_t parallel_threshold) {
    if (leaf_hashes.empty()) {
        SecureLogger::instance().warning("Refusing to build a Merkle tree over an empty batch");
        return ErrorCode::EMPTY_BATCH;
    }

    auto crypto = initialize_crypto();
    if (crypto.is_err()) {
        return crypto.error();
    }

    auto start_time = std::chrono::steady_clock::now();

    MerkleTree tree;
    const size_t n = leaf_hashes.size();
    tree.nodes_.reserve(2 * n - 1);

    std::vector<size_t> current(n);
    for (size_t i = 0; i < n; ++i) {
        Node leaf;
        leaf.hash = leaf_hashes[i];
        tree.nodes_.push_back(leaf);
        current[i] = i;
    }
    tree.levels_.push_back(current);

    try {
        while (current.size() > 1) {
            const size_t width = current.size();
            const size_t pairs = width / 2;
            const uint32_t level = static_cast<uint32_t>(tree.levels_.size());

            // Size the arena up front so parallel writers never reallocate
            const size_t base = tree.nodes_.size();
            tree.nodes_.resize(base + pairs);

            std::vector<size_t> next((width + 1) / 2);
            auto hash_range = [&](size_t begin, size_t end) {
                for (size_t p = begin; p < end; ++p) {
                    Node& node = tree.nodes_[base + p];
                    node.left = current[2 * p];
                    node.right = current[2 * p + 1];
                    node.level = level;
                    node.hash = hash_children(tree.nodes_[node.left].hash, tree.nodes_[node.right].hash);
                    next[p] = base + p;
                }
            };

            if (pool != nullptr && width >= parallel_threshold) {
                pool->parallel_for(pairs, constants::MIN_PARALLEL_CHUNK, hash_range);
            } else {
                hash_range(0, pairs);
            }

            // Carry-up: the unpaired last node moves up as-is
            if (width % 2 == 1) {
                next[pairs] = current[width - 1];
            }

            tree.levels_.push_back(next);
            current.swap(next);
        }
    } catch (const std::exception& e) {
        SecureLogger::instance().error("Merkle tree build failed: " + std::string(e.what()));
        return ErrorCode::THREAD_POOL_ERROR;
    }

    tree.root_ = current.front();

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);
    SecureLogger::instance().logf(SecureLogger::LogLevel::DEBUG,
                                  "Built Merkle tree: %zu leaves, height %zu, %zu nodes in %lld us",
                                  n, tree.height(), tree.nodes_.size(),
                                  static_cast<long long>(elapsed.count()));
    return tree;
}

const Digest& MerkleTree::root_hash() const {
    static const Digest empty_root{};
    return nodes_.empty() ? empty_root : nodes_[root_].hash;
}

std::string MerkleTree::root_hash_hex() const {
    return to_hex(root_hash());
}

std::vector<MerkleTree::Leaf> MerkleTree::leaves() const {
    std::vector<Leaf> result;
    result.reserve(leaf_count());
    for (size_t i = 0; i < leaf_count(); ++i) {
        result.push_back(leaf(i));
    }
    return result;
}

Result<MerkleProof> MerkleTree::generate_proof(size_t index) const {
    if (index >= leaf_count()) {
        SecureLogger::instance().debug("Proof requested for leaf " + std::to_string(index) +
                                       " of " + std::to_string(leaf_count()));
        return ErrorCode::INDEX_OUT_OF_RANGE;
    }

    MerkleProof proof;
    proof.leaf_count = leaf_count();
    proof.steps.reserve(height());

    size_t position = index;
    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& row = levels_[level];

        if (position % 2 == 1) {
            proof.steps.push_back({nodes_[row[position - 1]].hash, ProofPosition::LEFT});
        } else if (position + 1 < row.size()) {
            proof.steps.push_back({nodes_[row[position + 1]].hash, ProofPosition::RIGHT});
        }
        // Otherwise the node was carried up and this level adds nothing

        position /= 2;
    }

    return proof;
}

} // namespace sdk
} // namespace tagattest
