#pragma once

#include "types.hpp"
#include "BatchAttestation.hpp"
#include "MerkleProof.hpp"
#include "MerkleTree.hpp"
#include "RecordValue.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tagattest {
namespace sdk {

class ThreadPool;

/**
 * @brief Proof for one tag plus the leaf index it was cut for
 */
struct TagProof {
    size_t index = 0;
    MerkleProof proof;
};

/**
 * @brief One attested batch of NFC tags
 *
 * Owns the encoded tags, their tree and the attestation keyed by uid.
 */
class TagBatch {
public:
    TagBatch() = default;

    /**
     * @brief Encode, build and attest a batch of tags
     * @return EMPTY_BATCH, ENCODING_ERROR or DUPLICATE_LOGICAL_KEY on bad input
     */
    static Result<TagBatch> create(const std::vector<TagRecord>& tags,
                                   ThreadPool* pool = nullptr,
                                   const std::map<std::string, std::string>& metadata = {});

    const Digest& root_hash() const { return tree_.root_hash(); }
    const BatchAttestation& attestation() const { return attestation_; }
    const MerkleTree& tree() const { return tree_; }
    size_t size() const { return tags_.size(); }

    // std::nullopt when no tag has this uid
    Result<std::optional<TagProof>> generate_tag_proof(const std::string& uid) const;

    /**
     * @brief Check a proof against this batch's copy of the tag's data
     *
     * Unknown uid, malformed proof and mismatch all give false.
     */
    bool verify_tag(const std::string& uid, const MerkleProof& proof,
                    size_t index, const Digest& root_hash) const;

private:
    std::vector<TagRecord> tags_;
    std::unordered_map<std::string, size_t> by_uid_;
    MerkleTree tree_;
    BatchAttestation attestation_;
};

} // namespace sdk
} // namespace tagattest
