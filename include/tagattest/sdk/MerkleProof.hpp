#pragma once

#include "types.hpp"
#include <boost/property_tree/ptree.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tagattest {
namespace sdk {

/**
 * @brief Side of the sibling relative to the node being proven
 */
enum class ProofPosition {
    LEFT,
    RIGHT
};

struct ProofStep {
    Digest sibling_hash{};
    ProofPosition position = ProofPosition::LEFT;

    bool operator==(const ProofStep& other) const {
        return sibling_hash == other.sibling_hash && position == other.position;
    }
};

/**
 * @brief Audit path from one leaf to the root, leaf side first
 *
 * leaf_count is the size of the tree the path was cut from. With
 * carry-up the set of levels that contribute a step depends on it.
 */
struct MerkleProof {
    size_t leaf_count = 0;
    std::vector<ProofStep> steps;

    bool operator==(const MerkleProof& other) const {
        return leaf_count == other.leaf_count && steps == other.steps;
    }

    // {"leafCount": n, "steps": [{"siblingHash": "..", "position": "L"|"R"}]}
    boost::property_tree::ptree to_ptree() const;
    std::string to_json() const;

    // Fails with MALFORMED_PROOF on any structural problem
    static Result<MerkleProof> from_ptree(const boost::property_tree::ptree& tree);
    static Result<MerkleProof> from_json(const std::string& json);
};

const char* position_to_string(ProofPosition position);

/**
 * @brief Read a non-negative integer field written as a number or a string
 *
 * Throws ptree_bad_path when the field is missing. A sign, fraction or
 * value above 2^64-1 gives std::nullopt.
 */
std::optional<uint64_t> get_unsigned(const boost::property_tree::ptree& tree, const std::string& path);

} // namespace sdk
} // namespace tagattest
