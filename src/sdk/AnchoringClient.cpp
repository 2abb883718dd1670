/**
 * @file AnchoringClient.cpp
 * @brief In-memory and directory-backed anchoring stores
 */

#include "tagattest/sdk/AnchoringClient.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/MessageCompression.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <filesystem>
#include <fstream>

namespace tagattest {
namespace sdk {

namespace fs = std::filesystem;

Result<std::string> InMemoryAnchoringClient::store(const BatchAttestation& attestation) {
    if (!available_) {
        SecureLogger::instance().warning("In-memory anchoring store is offline");
        return ErrorCode::ANCHORING_UNAVAILABLE;
    }

    std::string transaction_id = attestation.attestation_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        anchored_.emplace(transaction_id, attestation);
    }

    SecureLogger::instance().info("Anchored attestation in memory: " + transaction_id);
    return transaction_id;
}

Result<BatchAttestation> InMemoryAnchoringClient::retrieve(const std::string& transaction_id) {
    if (!available_) {
        SecureLogger::instance().warning("In-memory anchoring store is offline");
        return ErrorCode::ANCHORING_UNAVAILABLE;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = anchored_.find(transaction_id);
    if (it == anchored_.end()) {
        return ErrorCode::NOT_FOUND;
    }
    return it->second;
}

size_t InMemoryAnchoringClient::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return anchored_.size();
}

FileAnchoringClient::FileAnchoringClient(const std::string& store_path)
    : store_path_(store_path) {
    std::error_code ec;
    fs::create_directories(store_path_, ec);
    if (ec) {
        // Reported again on every store/retrieve as ANCHORING_UNAVAILABLE
        SecureLogger::instance().error("Cannot create anchor store " + store_path_ + ": " + ec.message());
    }
}

std::string FileAnchoringClient::path_for(const std::string& transaction_id) const {
    return (fs::path(store_path_) / (transaction_id + ".att")).string();
}

Result<std::string> FileAnchoringClient::store(const BatchAttestation& attestation) {
    std::string json = attestation.to_json(false);
    auto compressed = MessageCompression::compress(ByteVector(json.begin(), json.end()));
    if (compressed.is_err()) {
        return compressed.error();
    }

    const ByteVector& payload = compressed.value();
    std::string transaction_id = to_hex(Sha256::digest(payload.data(), payload.size()));
    std::string filename = path_for(transaction_id);

    std::lock_guard<std::mutex> lock(write_mutex_);

    std::error_code ec;
    if (!fs::is_directory(store_path_, ec)) {
        SecureLogger::instance().error("Anchor store directory missing: " + store_path_);
        return ErrorCode::ANCHORING_UNAVAILABLE;
    }

    // Content-addressed, so an existing file already holds this payload
    if (fs::exists(filename, ec)) {
        SecureLogger::instance().debug("Attestation already anchored: " + transaction_id);
        return transaction_id;
    }

    std::string temp_filename = filename + ".tmp";
    {
        std::ofstream file(temp_filename, std::ios::binary | std::ios::trunc);
        if (!file) {
            SecureLogger::instance().error("Failed to open anchor file for writing: " + temp_filename);
            return ErrorCode::ANCHORING_UNAVAILABLE;
        }
        file.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        // Buffered bytes only reach the disk here; a failed flush fails the close
        file.close();
        if (!file) {
            SecureLogger::instance().error("Failed to write anchor file: " + temp_filename);
            fs::remove(temp_filename, ec);
            return ErrorCode::ANCHORING_UNAVAILABLE;
        }
    }

    fs::rename(temp_filename, filename, ec);
    if (ec) {
        SecureLogger::instance().error("Failed to publish anchor file " + filename + ": " + ec.message());
        fs::remove(temp_filename, ec);
        return ErrorCode::ANCHORING_UNAVAILABLE;
    }

    SecureLogger::instance().info("Anchored attestation " + attestation.attestation_id() +
                                  " as transaction " + transaction_id);
    return transaction_id;
}

Result<BatchAttestation> FileAnchoringClient::retrieve(const std::string& transaction_id) {
    // Ids are hex digests; anything else cannot name a stored file
    auto expected_digest = digest_from_hex(transaction_id);
    if (expected_digest.is_err()) {
        return ErrorCode::NOT_FOUND;
    }

    std::string filename = path_for(transaction_id);
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        if (ec) {
            SecureLogger::instance().error("Cannot access anchor store: " + ec.message());
            return ErrorCode::ANCHORING_UNAVAILABLE;
        }
        SecureLogger::instance().debug("Anchor not found: " + transaction_id);
        return ErrorCode::NOT_FOUND;
    }

    std::ifstream file(filename, std::ios::binary | std::ios::ate);
    if (!file) {
        SecureLogger::instance().error("Failed to open anchor file for reading: " + filename);
        return ErrorCode::ANCHORING_UNAVAILABLE;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    ByteVector payload(static_cast<size_t>(size > 0 ? size : 0));
    if (!file.read(reinterpret_cast<char*>(payload.data()), size)) {
        SecureLogger::instance().error("Failed to read anchor file: " + filename);
        return ErrorCode::ANCHORING_UNAVAILABLE;
    }

    if (!digests_equal(Sha256::digest(payload.data(), payload.size()), expected_digest.value())) {
        SecureLogger::instance().error("Anchor file content does not match its id: " + transaction_id);
        return ErrorCode::STORAGE_ERROR;
    }

    auto json = MessageCompression::decompress(payload);
    if (json.is_err()) {
        return ErrorCode::STORAGE_ERROR;
    }

    auto attestation = BatchAttestation::from_json(std::string(json.value().begin(), json.value().end()));
    if (attestation.is_err()) {
        SecureLogger::instance().error("Anchor file holds an invalid attestation: " + transaction_id);
        return ErrorCode::STORAGE_ERROR;
    }

    SecureLogger::instance().info("Retrieved anchored attestation " + transaction_id);
    return attestation;
}

} // namespace sdk
} // namespace tagattest
