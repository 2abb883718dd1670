#include "tagattest/sdk/BatchAttester.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/SecureLogger.hpp"

namespace tagattest {
namespace sdk {

Result<BatchAttestation> BatchAttester::create_attestation(
    const MerkleTree& tree,
    const std::vector<std::string>& logical_keys,
    TimePoint created_at,
    const std::map<std::string, std::string>& metadata) {

    if (tree.leaf_count() == 0) {
        SecureLogger::instance().warning("Refusing to attest an empty tree");
        return ErrorCode::EMPTY_BATCH;
    }

    if (logical_keys.size() != tree.leaf_count()) {
        SecureLogger::instance().warning("Got " + std::to_string(logical_keys.size()) +
                                         " logical keys for " + std::to_string(tree.leaf_count()) + " leaves");
        return ErrorCode::KEY_COUNT_MISMATCH;
    }

    BatchAttestation attestation;
    attestation.root_hash = tree.root_hash();
    attestation.record_count = tree.leaf_count();
    attestation.created_at = std::chrono::time_point_cast<std::chrono::milliseconds>(created_at);
    attestation.metadata = metadata;

    attestation.records.reserve(logical_keys.size());
    for (size_t i = 0; i < logical_keys.size(); ++i) {
        attestation.records.push_back({logical_keys[i], i});
    }

    auto index_result = attestation.build_key_index();
    if (index_result.is_err()) {
        return index_result.error();
    }

    SecureLogger::instance().info("Created attestation for " + std::to_string(attestation.record_count) +
                                  " records, root " + to_hex(attestation.root_hash));
    return attestation;
}

Result<std::optional<MerkleProof>> BatchAttester::lookup_proof(
    const BatchAttestation& attestation,
    const MerkleTree& tree,
    const std::string& logical_key) {

    if (tree.leaf_count() == 0 || attestation.record_count == 0) {
        SecureLogger::instance().warning("Proof lookup against an empty tree or attestation");
        return ErrorCode::EMPTY_BATCH;
    }

    if (tree.leaf_count() != attestation.record_count ||
        !digests_equal(tree.root_hash(), attestation.root_hash)) {
        SecureLogger::instance().warning("Proof lookup against a tree that does not match the attestation");
        return ErrorCode::ATTESTATION_MISMATCH;
    }

    auto index = attestation.find_index(logical_key);
    if (!index) {
        SecureLogger::instance().debug("No record for logical key " + logical_key);
        return std::optional<MerkleProof>();
    }

    auto proof = tree.generate_proof(*index);
    if (proof.is_err()) {
        return proof.error();
    }
    return std::optional<MerkleProof>(proof.value());
}

} // namespace sdk
} // namespace tagattest
