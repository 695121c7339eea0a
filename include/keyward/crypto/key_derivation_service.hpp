#pragma once

#include "keyward/configuration/identity_config.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"
#include "keyward/models/key_materials/ed25519_key_pair.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::identity::crypto {

struct EntropyReport {
    bool valid = true;
    std::vector<std::string> errors;
};

/**
 * @brief Deterministic Ed25519 keypairs from (email, passphrase)
 *
 * The normalized email is hashed into the Argon2id salt, the normalized
 * passphrase is stretched into a 32-byte seed, and the seed is expanded with
 * crypto_sign_seed_keypair. Same inputs and same KdfConfig always give the
 * same keypair; nothing secret outlives the returned Ed25519KeyPair.
 *
 * Immutable after construction and safe to share between threads.
 */
class KeyDerivationService {
public:
    /**
     * @brief Initialize libsodium and validate the Argon2id cost parameters
     *
     * @return Configuration failure when either step fails
     */
    [[nodiscard]] static Result<KeyDerivationService, IdentityFailure> Create(
        const configuration::KdfConfig& config);

    /**
     * @brief Derive the full keypair
     *
     * @return KeyDerivation failure only on allocation or Argon2id
     *         out-of-memory; any passphrase yields some keypair
     */
    [[nodiscard]] Result<models::Ed25519KeyPair, IdentityFailure> DeriveKeyPair(
        std::string_view email,
        std::string_view passphrase) const;

    /**
     * @brief Derive and keep only the public key
     */
    [[nodiscard]] Result<models::PublicKeyBytes, IdentityFailure> DerivePublicKey(
        std::string_view email,
        std::string_view passphrase) const;

    /**
     * @brief Detached Ed25519 signature over the nonce bytes, base64 encoded
     */
    [[nodiscard]] Result<std::string, IdentityFailure> SignChallenge(
        const models::Ed25519KeyPair& key_pair,
        std::string_view nonce) const;

    /**
     * @brief Verify a base64 signature against a base64 public key
     *
     * Malformed base64, wrong lengths and bad signatures all yield false.
     */
    [[nodiscard]] bool VerifySignature(
        std::string_view public_key,
        std::string_view signature,
        std::string_view nonce) const;

    /**
     * @brief Check a candidate passphrase against the entropy floor
     *
     * Length and distinct characters are counted in grapheme clusters of the
     * normalized passphrase, the same text DeriveKeyPair feeds to Argon2id.
     * Leading and trailing whitespace is trimmed and inner whitespace runs
     * collapse to one space before counting, so "   abcdefghijk   " measures
     * 11 characters and fails a 12-character floor.
     */
    [[nodiscard]] static EntropyReport ValidatePassphraseEntropy(
        std::string_view passphrase,
        size_t min_length = kDefaultMinPassphraseLength,
        size_t min_unique_chars = kDefaultMinUniqueChars);

    [[nodiscard]] static std::string EncodePublicKey(const models::PublicKeyBytes& public_key);

    [[nodiscard]] static std::optional<models::PublicKeyBytes> DecodePublicKey(
        std::string_view encoded);

    [[nodiscard]] const configuration::KdfConfig& Config() const noexcept {
        return config_;
    }

private:
    explicit KeyDerivationService(const configuration::KdfConfig& config) noexcept
        : config_(config) {}

    configuration::KdfConfig config_;
};

} // namespace keyward::identity::crypto
