#include "tagattest/sdk/TagBatch.hpp"
#include "tagattest/sdk/BatchAttester.hpp"
#include "tagattest/sdk/LeafEncoder.hpp"
#include "tagattest/sdk/ProofVerifier.hpp"
#include "tagattest/sdk/SecureLogger.hpp"

namespace tagattest {
namespace sdk {

Result<TagBatch> TagBatch::create(const std::vector<TagRecord>& tags,
                                  ThreadPool* pool,
                                  const std::map<std::string, std::string>& metadata) {
    auto leaves = LeafEncoder::encode_all(tags);
    if (leaves.is_err()) {
        return leaves.error();
    }

    auto tree = MerkleTree::build(leaves.value(), pool);
    if (tree.is_err()) {
        return tree.error();
    }

    std::vector<std::string> uids;
    uids.reserve(tags.size());
    for (const auto& tag : tags) {
        uids.push_back(tag.uid);
    }

    auto attestation = BatchAttester::create_attestation(tree.value(), uids,
                                                         std::chrono::system_clock::now(), metadata);
    if (attestation.is_err()) {
        return attestation.error();
    }

    TagBatch batch;
    batch.tags_ = tags;
    batch.tree_ = tree.take();
    batch.attestation_ = attestation.take();
    batch.by_uid_ = batch.attestation_.key_index;
    return batch;
}

Result<std::optional<TagProof>> TagBatch::generate_tag_proof(const std::string& uid) const {
    auto proof = BatchAttester::lookup_proof(attestation_, tree_, uid);
    if (proof.is_err()) {
        return proof.error();
    }
    if (!proof.value()) {
        return std::optional<TagProof>();
    }
    return std::optional<TagProof>(TagProof{by_uid_.at(uid), *proof.value()});
}

bool TagBatch::verify_tag(const std::string& uid, const MerkleProof& proof,
                          size_t index, const Digest& root_hash) const {
    auto it = by_uid_.find(uid);
    if (it == by_uid_.end()) {
        SecureLogger::instance().debug("verify_tag: unknown uid " + uid);
        return false;
    }

    auto result = ProofVerifier::verify(tags_[it->second], index, proof, root_hash);
    if (result.is_err()) {
        SecureLogger::instance().warning("verify_tag: " + result.error_message());
        return false;
    }
    return result.value();
}

} // namespace sdk
} // namespace tagattest
