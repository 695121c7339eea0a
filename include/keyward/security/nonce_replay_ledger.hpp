#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/interfaces/i_clock.hpp"
#include <unordered_map>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
namespace keyward::identity::security {
// In-process record of consumed challenge nonces. Entries older than the nonce
// lifetime can no longer validate and are pruned on the cleanup interval.
class NonceReplayLedger {
public:
    explicit NonceReplayLedger(
        std::chrono::seconds nonce_lifetime = kDefaultNonceTtl,
        std::chrono::seconds cleanup_interval = kDefaultNonceTtl,
        std::shared_ptr<const interfaces::IClock> clock = nullptr);
    NonceReplayLedger(const NonceReplayLedger&) = delete;
    NonceReplayLedger& operator=(const NonceReplayLedger&) = delete;
    NonceReplayLedger(NonceReplayLedger&&) = delete;
    NonceReplayLedger& operator=(NonceReplayLedger&&) = delete;
    ~NonceReplayLedger() = default;
    // ReplayDetected when this nonce was already consumed for the identifier.
    Result<Unit, IdentityFailure> Consume(
        std::string_view identifier,
        std::string_view nonce);
    void CleanupExpiredNonces();
    size_t TrackedCount() const;
    // How long a consumed nonce is remembered. Must cover the nonce TTL plus clock skew.
    std::chrono::seconds Lifetime() const noexcept {
        return nonce_lifetime_;
    }
    void Reset();
private:
    struct NonceKey {
        std::string identifier;
        std::string nonce;
        bool operator==(const NonceKey& other) const {
            return identifier == other.identifier && nonce == other.nonce;
        }
        struct Hash {
            size_t operator()(const NonceKey& key) const;
        };
    };
    bool ShouldCleanup(std::chrono::system_clock::time_point now) const;
    void CleanupExpiredNoncesInternal(std::chrono::system_clock::time_point now);
    std::chrono::seconds nonce_lifetime_;
    std::chrono::seconds cleanup_interval_;
    std::shared_ptr<const interfaces::IClock> clock_;
    mutable std::mutex lock_;
    std::unordered_map<NonceKey, std::chrono::system_clock::time_point, NonceKey::Hash> consumed_nonces_;
    std::chrono::system_clock::time_point last_cleanup_;
};
}
