#include "keyward/configuration/identity_config.hpp"
#include "keyward/core/format.hpp"

namespace keyward::identity::configuration {

Result<Unit, IdentityFailure> KdfConfig::Validate() const {
    if (ops_limit < crypto_pwhash_argon2id_opslimit_min() ||
        ops_limit > crypto_pwhash_argon2id_opslimit_max()) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration(
                compat::format("Argon2id ops limit {} outside [{}, {}]",
                               ops_limit,
                               crypto_pwhash_argon2id_opslimit_min(),
                               crypto_pwhash_argon2id_opslimit_max())));
    }
    if (mem_limit < crypto_pwhash_argon2id_memlimit_min() ||
        mem_limit > crypto_pwhash_argon2id_memlimit_max()) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration(
                compat::format("Argon2id memory limit {} outside [{}, {}]",
                               mem_limit,
                               crypto_pwhash_argon2id_memlimit_min(),
                               crypto_pwhash_argon2id_memlimit_max())));
    }
    return Result<Unit, IdentityFailure>::Ok(unit);
}

Result<Unit, IdentityFailure> NonceConfig::Validate() const {
    if (secret.size() < kMinNonceSecretBytes) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration(std::string(ErrorMessages::NONCE_SECRET_TOO_SHORT)));
    }
    if (ttl.count() <= 0) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration(std::string(ErrorMessages::NONCE_TTL_NOT_POSITIVE)));
    }
    if (max_clock_skew.count() < 0) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration("Nonce clock skew must not be negative"));
    }
    return Result<Unit, IdentityFailure>::Ok(unit);
}

Result<Unit, IdentityFailure> TrustConfig::Validate() const {
    if (cookie_name.empty()) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration("Trust cookie name must not be empty"));
    }
    if (lifetime.count() <= 0) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration("Trust lifetime must be positive"));
    }
    return Result<Unit, IdentityFailure>::Ok(unit);
}

IdentityConfig IdentityConfig::WithSecret(std::string secret) {
    IdentityConfig config;
    config.nonce.secret = std::move(secret);
    return config;
}

Result<Unit, IdentityFailure> IdentityConfig::Validate() const {
    if (auto kdf_result = kdf.Validate(); kdf_result.IsErr()) {
        return kdf_result;
    }
    if (auto nonce_result = nonce.Validate(); nonce_result.IsErr()) {
        return nonce_result;
    }
    if (auto trust_result = trust.Validate(); trust_result.IsErr()) {
        return trust_result;
    }
    if (entropy.min_length == 0) {
        return Result<Unit, IdentityFailure>::Err(
            IdentityFailure::Configuration("Minimum passphrase length must be positive"));
    }
    return Result<Unit, IdentityFailure>::Ok(unit);
}

} // namespace keyward::identity::configuration
