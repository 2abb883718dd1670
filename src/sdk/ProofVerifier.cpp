#include "tagattest/sdk/ProofVerifier.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/LeafEncoder.hpp"
#include "tagattest/sdk/MerkleTree.hpp"
#include "tagattest/sdk/SecureLogger.hpp"

namespace tagattest {
namespace sdk {

Result<void> ProofVerifier::validate_shape(const MerkleProof& proof) {
    if (proof.leaf_count == 0) {
        SecureLogger::instance().warning("Rejected proof for an empty tree");
        return ErrorCode::MALFORMED_PROOF;
    }
    if (proof.steps.size() > constants::MAX_PROOF_DEPTH) {
        SecureLogger::instance().warning("Rejected proof with " + std::to_string(proof.steps.size()) + " steps");
        return ErrorCode::MALFORMED_PROOF;
    }
    return ErrorCode::SUCCESS;
}

Result<bool> ProofVerifier::verify(const Digest& leaf_hash, size_t index,
                                   const MerkleProof& proof, const Digest& root_hash) {
    auto shape = validate_shape(proof);
    if (shape.is_err()) {
        return shape.error();
    }

    // Path shape is a function of (index, leaf_count); walk it in full and
    // fold every supplied step, accumulating mismatches instead of returning.
    bool consistent = index < proof.leaf_count;
    Digest current = leaf_hash;
    size_t position = consistent ? index : 0;
    size_t width = proof.leaf_count;
    size_t consumed = 0;

    while (width > 1) {
        const bool is_right_child = (position % 2 == 1);
        const bool has_sibling = is_right_child || position + 1 < width;

        if (has_sibling) {
            if (consumed < proof.steps.size()) {
                const ProofStep& step = proof.steps[consumed];
                const ProofPosition expected = is_right_child ? ProofPosition::LEFT : ProofPosition::RIGHT;
                consistent &= (step.position == expected);

                if (step.position == ProofPosition::LEFT) {
                    current = MerkleTree::hash_children(step.sibling_hash, current);
                } else {
                    current = MerkleTree::hash_children(current, step.sibling_hash);
                }
            } else {
                consistent = false;
            }
            ++consumed;
        }

        position /= 2;
        width = (width + 1) / 2;
    }

    // Extra steps are still hashed so a long tail costs the same as a match
    for (size_t i = consumed; i < proof.steps.size(); ++i) {
        const ProofStep& step = proof.steps[i];
        current = step.position == ProofPosition::LEFT
                      ? MerkleTree::hash_children(step.sibling_hash, current)
                      : MerkleTree::hash_children(current, step.sibling_hash);
    }
    consistent &= (consumed == proof.steps.size());

    const bool root_matches = digests_equal(current, root_hash);
    return consistent && root_matches;
}

Result<bool> ProofVerifier::verify(const ByteVector& raw_leaf_data, size_t index,
                                   const MerkleProof& proof, const Digest& root_hash) {
    return verify(LeafEncoder::encode(raw_leaf_data), index, proof, root_hash);
}

Result<bool> ProofVerifier::verify(const std::string& raw_leaf_data, size_t index,
                                   const MerkleProof& proof, const Digest& root_hash) {
    return verify(LeafEncoder::encode(raw_leaf_data), index, proof, root_hash);
}

Result<bool> ProofVerifier::verify(const TagRecord& record, size_t index,
                                   const MerkleProof& proof, const Digest& root_hash) {
    auto leaf_hash = LeafEncoder::encode(record);
    if (leaf_hash.is_err()) {
        return leaf_hash.error();
    }
    return verify(leaf_hash.value(), index, proof, root_hash);
}

} // namespace sdk
} // namespace tagattest
