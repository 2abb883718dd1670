#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "BatchAttestation.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tagattest {
namespace sdk {

/**
 * @brief Boundary to an immutable store that anchors attestations
 *
 * Implementations own transport and storage. Callers own retries:
 * ANCHORING_UNAVAILABLE is returned as-is, never retried here.
 */
class AnchoringClient {
public:
    virtual ~AnchoringClient() = default;

    // Persist an attestation; returns the storage-assigned transaction id
    virtual Result<std::string> store(const BatchAttestation& attestation) = 0;

    // Fetch a previously stored attestation; NOT_FOUND for unknown ids
    virtual Result<BatchAttestation> retrieve(const std::string& transaction_id) = 0;
};

/**
 * @brief Process-local anchoring store
 *
 * Transaction ids are the attestation ids. set_available(false) makes
 * every call fail with ANCHORING_UNAVAILABLE.
 */
class InMemoryAnchoringClient : public AnchoringClient {
public:
    Result<std::string> store(const BatchAttestation& attestation) override;
    Result<BatchAttestation> retrieve(const std::string& transaction_id) override;

    void set_available(bool available) { available_ = available; }
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, BatchAttestation> anchored_;
    std::atomic<bool> available_{true};
};

/**
 * @brief Write-once directory store
 *
 * Each attestation is written as gzip-compressed JSON to
 * <store_path>/<transaction id>.att, where the id is the hex SHA-256 of
 * the compressed payload. Existing files are never overwritten.
 */
class FileAnchoringClient : public AnchoringClient {
public:
    explicit FileAnchoringClient(const std::string& store_path = constants::ATTESTATION_STORE_PATH);

    Result<std::string> store(const BatchAttestation& attestation) override;
    Result<BatchAttestation> retrieve(const std::string& transaction_id) override;

    const std::string& store_path() const { return store_path_; }

private:
    std::string path_for(const std::string& transaction_id) const;

    std::string store_path_;
    std::mutex write_mutex_;
};

} // namespace sdk
} // namespace tagattest
