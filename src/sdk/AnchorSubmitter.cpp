#include "tagattest/sdk/AnchorSubmitter.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <algorithm>
#include <random>
#include <thread>

namespace tagattest {
namespace sdk {

AnchorSubmitter::AnchorSubmitter(AnchoringClient& client,
                                 size_t max_retries,
                                 std::chrono::milliseconds initial_backoff)
    : client_(client),
      max_retries_(max_retries),
      initial_backoff_(initial_backoff) {
}

std::chrono::milliseconds AnchorSubmitter::backoff_for(size_t attempt) const {
    // Cap the shift so the delay cannot overflow
    auto base = initial_backoff_.count() << std::min<size_t>(attempt, 16);
    if (base <= 0) {
        return std::chrono::milliseconds(0);
    }

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<long long> jitter(-base / 4, base / 4);
    return std::chrono::milliseconds(base + jitter(gen));
}

Result<std::string> AnchorSubmitter::submit(const BatchAttestation& attestation) {
    const size_t max_attempts = max_retries_ + 1;
    last_attempts_ = 0;

    for (size_t attempt = 0; attempt < max_attempts; attempt++) {
        ++last_attempts_;
        auto result = client_.store(attestation);
        if (result.is_ok()) {
            return result;
        }

        if (result.error() != ErrorCode::ANCHORING_UNAVAILABLE) {
            SecureLogger::instance().error("Anchoring failed: " + result.error_message());
            return result;
        }

        SecureLogger::instance().warning("Anchoring store unavailable (attempt " +
                                         std::to_string(attempt + 1) + "/" +
                                         std::to_string(max_attempts) + ")");

        if (attempt + 1 < max_attempts) {
            auto delay = backoff_for(attempt);
            SecureLogger::instance().debug("Retrying anchoring in " + std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
        }
    }

    SecureLogger::instance().error("All attempts to anchor attestation " + attestation.attestation_id() + " failed");
    return ErrorCode::ANCHORING_UNAVAILABLE;
}

} // namespace sdk
} // namespace tagattest
