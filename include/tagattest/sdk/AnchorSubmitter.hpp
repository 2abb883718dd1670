#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "AnchoringClient.hpp"
#include <chrono>
#include <string>

namespace tagattest {
namespace sdk {

/**
 * @brief Stores attestations through an AnchoringClient with retries
 *
 * Only ANCHORING_UNAVAILABLE is retried. The delay doubles after each
 * attempt, with +/-25% jitter. Any other error is returned at once.
 */
class AnchorSubmitter {
public:
    AnchorSubmitter(AnchoringClient& client,
                    size_t max_retries = constants::DEFAULT_ANCHOR_RETRIES,
                    std::chrono::milliseconds initial_backoff = constants::DEFAULT_ANCHOR_BACKOFF);

    Result<std::string> submit(const BatchAttestation& attestation);

    // Attempts made by the last submit()
    size_t last_attempts() const { return last_attempts_; }

private:
    std::chrono::milliseconds backoff_for(size_t attempt) const;

    AnchoringClient& client_;
    size_t max_retries_;
    std::chrono::milliseconds initial_backoff_;
    size_t last_attempts_ = 0;
};

} // namespace sdk
} // namespace tagattest
