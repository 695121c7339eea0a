#include "keyward/security/nonce_replay_ledger.hpp"
#include <functional>

namespace keyward::identity::security {
    namespace {
        constexpr size_t kFnvPrime = 0x100000001b3ULL;
    }

    size_t NonceReplayLedger::NonceKey::Hash::operator()(const NonceKey &key) const {
        size_t hash = std::hash<std::string>{}(key.identifier);
        hash ^= std::hash<std::string>{}(key.nonce);
        hash *= kFnvPrime;
        return hash;
    }

    NonceReplayLedger::NonceReplayLedger(
        const std::chrono::seconds nonce_lifetime,
        const std::chrono::seconds cleanup_interval,
        std::shared_ptr<const interfaces::IClock> clock)
        : nonce_lifetime_(nonce_lifetime)
          , cleanup_interval_(cleanup_interval)
          , clock_(clock ? std::move(clock) : std::make_shared<interfaces::SystemClock>())
          , last_cleanup_(clock_->Now()) {
    }

    Result<Unit, IdentityFailure> NonceReplayLedger::Consume(
        const std::string_view identifier,
        const std::string_view nonce) {
        std::lock_guard guard(lock_);
        const auto now = clock_->Now();
        if (ShouldCleanup(now)) {
            last_cleanup_ = now;
            CleanupExpiredNoncesInternal(now);
        }
        NonceKey nonce_key{
            .identifier = std::string(identifier),
            .nonce = std::string(nonce)
        };
        if (const auto [it, inserted] = consumed_nonces_.try_emplace(std::move(nonce_key), now); !inserted) {
            return Result<Unit, IdentityFailure>::Err(
                IdentityFailure::ReplayDetected(std::string(ErrorMessages::NONCE_ALREADY_USED)));
        }
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

    void NonceReplayLedger::CleanupExpiredNonces() {
        std::lock_guard guard(lock_);
        CleanupExpiredNoncesInternal(clock_->Now());
    }

    void NonceReplayLedger::CleanupExpiredNoncesInternal(const std::chrono::system_clock::time_point now) {
        const auto expiry_threshold = now - nonce_lifetime_;
        auto it = consumed_nonces_.begin();
        while (it != consumed_nonces_.end()) {
            if (it->second < expiry_threshold) {
                it = consumed_nonces_.erase(it);
            } else {
                ++it;
            }
        }
    }

    bool NonceReplayLedger::ShouldCleanup(const std::chrono::system_clock::time_point now) const {
        return now - last_cleanup_ >= cleanup_interval_;
    }

    size_t NonceReplayLedger::TrackedCount() const {
        std::lock_guard guard(lock_);
        return consumed_nonces_.size();
    }

    void NonceReplayLedger::Reset() {
        std::lock_guard guard(lock_);
        consumed_nonces_.clear();
        last_cleanup_ = clock_->Now();
    }
}
