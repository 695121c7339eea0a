#pragma once

#include "keyward/core/constants.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"

#include <sodium.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace keyward::identity::configuration {

/// Argon2id cost parameters for the passphrase KDF.
///
/// Changing either value changes every derived key, so a deployment picks one
/// profile and keeps it for the lifetime of its stored public keys.
struct KdfConfig {
    uint64_t ops_limit = crypto_pwhash_argon2id_OPSLIMIT_MODERATE;
    size_t mem_limit = crypto_pwhash_argon2id_MEMLIMIT_MODERATE;

    /// 2 passes, 64 MiB.
    [[nodiscard]] static constexpr KdfConfig Interactive() noexcept {
        return {crypto_pwhash_argon2id_OPSLIMIT_INTERACTIVE,
                crypto_pwhash_argon2id_MEMLIMIT_INTERACTIVE};
    }

    /// 3 passes, 256 MiB. Default.
    [[nodiscard]] static constexpr KdfConfig Moderate() noexcept {
        return {crypto_pwhash_argon2id_OPSLIMIT_MODERATE,
                crypto_pwhash_argon2id_MEMLIMIT_MODERATE};
    }

    /// 4 passes, 1 GiB.
    [[nodiscard]] static constexpr KdfConfig Sensitive() noexcept {
        return {crypto_pwhash_argon2id_OPSLIMIT_SENSITIVE,
                crypto_pwhash_argon2id_MEMLIMIT_SENSITIVE};
    }

    /// libsodium's lower bounds. Only for tests and fixtures.
    [[nodiscard]] static constexpr KdfConfig Minimum() noexcept {
        return {crypto_pwhash_argon2id_OPSLIMIT_MIN,
                crypto_pwhash_argon2id_MEMLIMIT_MIN};
    }

    [[nodiscard]] Result<Unit, IdentityFailure> Validate() const;
};

/// Challenge nonce settings. The secret is the application key.
struct NonceConfig {
    std::string secret;
    std::chrono::seconds ttl = kDefaultNonceTtl;
    /// How far in the future a nonce timestamp may lie before it is rejected.
    std::chrono::seconds max_clock_skew{0};

    [[nodiscard]] Result<Unit, IdentityFailure> Validate() const;
};

/// Floor applied on registration and recovery, never on login.
struct EntropyPolicy {
    size_t min_length = kDefaultMinPassphraseLength;
    size_t min_unique_chars = kDefaultMinUniqueChars;
};

struct TrustConfig {
    std::string cookie_name{kDefaultTrustCookieName};
    std::chrono::seconds lifetime = kDefaultTrustLifetime;
    std::string default_ip{kDefaultClientIp};

    [[nodiscard]] Result<Unit, IdentityFailure> Validate() const;
};

enum class GuardDriver : uint8_t {
    Key = 0
};

struct GuardConfig {
    std::string name{kDefaultGuardName};
    GuardDriver driver = GuardDriver::Key;
};

/// Everything the identity core reads at construction time. Nothing is read
/// from globals; tests pass deterministic fixtures.
struct IdentityConfig {
    bool enabled = true;
    /// Run a full derivation for unknown emails so they cost the same as a
    /// wrong passphrase.
    bool mask_unknown_identities = true;
    KdfConfig kdf = KdfConfig::Moderate();
    NonceConfig nonce;
    EntropyPolicy entropy;
    TrustConfig trust;
    GuardConfig guard;

    [[nodiscard]] static IdentityConfig WithSecret(std::string secret);

    [[nodiscard]] Result<Unit, IdentityFailure> Validate() const;
};

} // namespace keyward::identity::configuration
