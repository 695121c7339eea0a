#pragma once

#include "keyward/configuration/identity_config.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/interfaces/i_clock.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::identity {

/**
 * @brief Stateless, identifier-bound, time-limited challenge nonces
 *
 * Wire format: <32 hex random>.<unix seconds>.<64 hex HMAC-SHA256>, where the
 * HMAC covers "identifier|random.seconds" under the application secret. A
 * nonce issued for one identifier never validates for another.
 *
 * Validation does not consume the nonce; pair with NonceReplayLedger where
 * single use is required.
 */
class NonceService {
public:
    /**
     * @brief Copy the secret into secure memory and bind the clock
     *
     * @param clock defaults to SystemClock when null
     * @return Configuration failure for a short secret or non-positive TTL
     */
    [[nodiscard]] static Result<NonceService, IdentityFailure> Create(
        const configuration::NonceConfig& config,
        std::shared_ptr<const interfaces::IClock> clock = nullptr);

    [[nodiscard]] std::string Generate(std::string_view identifier) const;

    /**
     * @brief Structure, freshness and HMAC check
     *
     * A nonce issued at t0 is accepted up to and including t0 + TTL.
     */
    [[nodiscard]] bool Validate(std::string_view identifier, std::string_view nonce) const;

    [[nodiscard]] std::chrono::seconds Ttl() const noexcept {
        return ttl_;
    }

    [[nodiscard]] std::chrono::seconds MaxClockSkew() const noexcept {
        return max_clock_skew_;
    }

    NonceService(NonceService&&) noexcept = default;
    NonceService& operator=(NonceService&&) noexcept = default;
    NonceService(const NonceService&) = delete;
    NonceService& operator=(const NonceService&) = delete;
    ~NonceService() = default;

private:
    struct ParsedNonce {
        std::string_view random;
        int64_t timestamp = 0;
        std::string_view mac;
    };

    NonceService(
        crypto::SecureMemoryHandle secret,
        std::chrono::seconds ttl,
        std::chrono::seconds max_clock_skew,
        std::shared_ptr<const interfaces::IClock> clock) noexcept;

    [[nodiscard]] static std::optional<ParsedNonce> Parse(std::string_view nonce);

    [[nodiscard]] Result<std::vector<uint8_t>, SodiumFailure> ComputeMac(
        std::string_view identifier,
        std::string_view payload) const;

    [[nodiscard]] int64_t UnixNow() const;

    crypto::SecureMemoryHandle secret_;
    std::chrono::seconds ttl_;
    std::chrono::seconds max_clock_skew_;
    std::shared_ptr<const interfaces::IClock> clock_;
};

} // namespace keyward::identity
