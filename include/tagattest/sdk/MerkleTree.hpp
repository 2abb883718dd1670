#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "MerkleProof.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace tagattest {
namespace sdk {

class ThreadPool;

/**
 * @brief Immutable binary hash tree over an ordered batch of leaf digests
 *
 * Nodes live in one flat arena owned by the tree and reference their
 * children by arena index. Parent hash is SHA-256(0x01 || left || right).
 * An unpaired node at the end of a level is promoted to the next level
 * unchanged; it is never duplicated.
 *
 * A built tree is never mutated, so it may be read from any number of
 * threads.
 */
class MerkleTree {
public:
    static constexpr size_t NO_CHILD = std::numeric_limits<size_t>::max();

    struct Node {
        Digest hash{};
        uint32_t level = 0;     // Level the node was created at; leaves are 0
        size_t left = NO_CHILD;
        size_t right = NO_CHILD;

        bool is_leaf() const {
            return left == NO_CHILD && right == NO_CHILD;
        }
    };

    struct Leaf {
        size_t index;
        Digest hash;
    };

    MerkleTree() = default;

    /**
     * @brief Build a tree from leaf digests in batch order
     * @param leaf_hashes Output of LeafEncoder, at least one
     * @param pool Optional worker pool for hashing wide levels
     * @param parallel_threshold Minimum level width hashed on the pool
     * @return The tree, or EMPTY_BATCH for zero leaves
     */
    static Result<MerkleTree> build(const std::vector<Digest>& leaf_hashes,
                                    ThreadPool* pool = nullptr,
                                    size_t parallel_threshold = constants::DEFAULT_PARALLEL_THRESHOLD);

    // Parent hash of two children
    static Digest hash_children(const Digest& left, const Digest& right);

    // All-zero digest for a default-constructed tree
    const Digest& root_hash() const;
    std::string root_hash_hex() const;

    size_t leaf_count() const { return levels_.empty() ? 0 : levels_.front().size(); }

    // Number of levels above the leaves; 0 for a single leaf
    size_t height() const { return levels_.empty() ? 0 : levels_.size() - 1; }

    // index must be below leaf_count()
    Leaf leaf(size_t index) const { return Leaf{index, nodes_[index].hash}; }
    std::vector<Leaf> leaves() const;

    const std::vector<Node>& nodes() const { return nodes_; }

    /**
     * @brief Audit path for the leaf at index
     * @return The proof, or INDEX_OUT_OF_RANGE
     */
    Result<MerkleProof> generate_proof(size_t index) const;

private:
    std::vector<Node> nodes_;
    // Arena indices of the nodes present at each level, leaves first
    std::vector<std::vector<size_t>> levels_;
    size_t root_ = 0;
};

} // namespace sdk
} // namespace tagattest
