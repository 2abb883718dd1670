#pragma once

#include "types.hpp"
#include "MerkleProof.hpp"
#include "RecordValue.hpp"
#include <string>

namespace tagattest {
namespace sdk {

/**
 * @brief Recomputes an audit path and compares it with a published root
 *
 * A proof that does not match (wrong data, wrong index, truncated or
 * extended path, path from another tree) yields Result<bool>{false}.
 * Errors are reserved for input that cannot be checked at all:
 * MALFORMED_PROOF for a proof with leaf_count 0 or more than
 * MAX_PROOF_DEPTH steps, ENCODING_ERROR when a record cannot be
 * re-encoded.
 *
 * Every step is hashed and checked even after a mismatch, and the final
 * root comparison is constant time.
 */
class ProofVerifier {
public:
    static Result<bool> verify(const Digest& leaf_hash, size_t index,
                               const MerkleProof& proof, const Digest& root_hash);

    static Result<bool> verify(const ByteVector& raw_leaf_data, size_t index,
                               const MerkleProof& proof, const Digest& root_hash);

    static Result<bool> verify(const std::string& raw_leaf_data, size_t index,
                               const MerkleProof& proof, const Digest& root_hash);

    static Result<bool> verify(const TagRecord& record, size_t index,
                               const MerkleProof& proof, const Digest& root_hash);

    // Shape checks that do not depend on the leaf or index
    static Result<void> validate_shape(const MerkleProof& proof);
};

} // namespace sdk
} // namespace tagattest
