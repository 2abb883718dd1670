#pragma once

#include "types.hpp"
#include "BatchAttestation.hpp"
#include "MerkleProof.hpp"
#include "MerkleTree.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tagattest {
namespace sdk {

/**
 * @brief Wraps a built tree into a BatchAttestation and resolves keys to proofs
 */
class BatchAttester {
public:
    /**
     * @brief Create the attestation for a tree
     * @param tree Built tree
     * @param logical_keys One business key per leaf, in leaf order
     * @param created_at Creation time, truncated to milliseconds
     * @param metadata Free-form labels carried with the attestation
     * @return KEY_COUNT_MISMATCH or DUPLICATE_LOGICAL_KEY on bad keys
     */
    static Result<BatchAttestation> create_attestation(
        const MerkleTree& tree,
        const std::vector<std::string>& logical_keys,
        TimePoint created_at = std::chrono::system_clock::now(),
        const std::map<std::string, std::string>& metadata = {});

    /**
     * @brief Proof for a logical key
     *
     * An unknown key is an expected outcome and yields std::nullopt.
     * ATTESTATION_MISMATCH when the tree is not the one attested.
     */
    static Result<std::optional<MerkleProof>> lookup_proof(
        const BatchAttestation& attestation,
        const MerkleTree& tree,
        const std::string& logical_key);
};

} // namespace sdk
} // namespace tagattest
