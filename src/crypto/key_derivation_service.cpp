#include "keyward/crypto/key_derivation_service.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/crypto/text_normalizer.hpp"
#include "keyward/core/format.hpp"
#include "keyward/debug/auth_trace.hpp"

#include <sodium.h>
#include <array>
#include <algorithm>

namespace keyward::identity::crypto {
    using configuration::KdfConfig;
    using models::Ed25519KeyPair;
    using models::PublicKeyBytes;
    using debug::Component;

    static_assert(kKdfSaltBytes == crypto_pwhash_SALTBYTES);
    static_assert(kEd25519SeedBytes == crypto_sign_SEEDBYTES);
    static_assert(kEd25519SecretKeyBytes == crypto_sign_SECRETKEYBYTES);
    static_assert(kEd25519PublicKeyBytes == crypto_sign_PUBLICKEYBYTES);
    static_assert(kEd25519SignatureBytes == crypto_sign_BYTES);

    namespace {
        void WipeSecretText(std::string& text) {
            sodium_memzero(text.data(), text.size());
            text.clear();
        }
    }

    Result<KeyDerivationService, IdentityFailure> KeyDerivationService::Create(
        const KdfConfig& config) {
        if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
            return Result<KeyDerivationService, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }
        if (auto config_result = config.Validate(); config_result.IsErr()) {
            return Result<KeyDerivationService, IdentityFailure>::Err(
                std::move(config_result).UnwrapErr());
        }
        KEYWARD_TRACE(Component::KeyDerivation, "Create", "ops_limit={} mem_limit={}",
                      config.ops_limit, config.mem_limit);
        return Result<KeyDerivationService, IdentityFailure>::Ok(KeyDerivationService(config));
    }

    Result<Ed25519KeyPair, IdentityFailure> KeyDerivationService::DeriveKeyPair(
        std::string_view email,
        std::string_view passphrase) const {
        const std::string normalized_email = TextNormalizer::NormalizeEmail(email);
        auto passphrase_result = TextNormalizer::NormalizePassphrase(passphrase);
        if (passphrase_result.IsErr()) {
            return Result<Ed25519KeyPair, IdentityFailure>::Err(
                std::move(passphrase_result).UnwrapErr());
        }
        std::string normalized_passphrase = std::move(passphrase_result).Unwrap();

        std::array<uint8_t, kKdfSaltBytes> salt{};
        crypto_generichash(
            salt.data(), salt.size(),
            reinterpret_cast<const unsigned char*>(normalized_email.data()),
            normalized_email.size(),
            nullptr, 0);

        auto seed_alloc = SecureMemoryHandle::Allocate(kEd25519SeedBytes);
        if (seed_alloc.IsErr()) {
            WipeSecretText(normalized_passphrase);
            return Result<Ed25519KeyPair, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(seed_alloc.UnwrapErr()));
        }
        SecureMemoryHandle seed_handle = std::move(seed_alloc).Unwrap();

        auto kdf_result = seed_handle.WithWriteAccess([&](std::span<uint8_t> seed) {
            return crypto_pwhash(
                seed.data(), seed.size(),
                normalized_passphrase.data(), normalized_passphrase.size(),
                salt.data(),
                config_.ops_limit,
                config_.mem_limit,
                crypto_pwhash_ALG_ARGON2ID13);
        });
        WipeSecretText(normalized_passphrase);
        if (kdf_result.IsErr()) {
            return Result<Ed25519KeyPair, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(kdf_result.UnwrapErr()));
        }
        if (kdf_result.Unwrap() != 0) {
            KEYWARD_TRACE(Component::KeyDerivation, "DeriveKeyPair", "argon2id failed");
            return Result<Ed25519KeyPair, IdentityFailure>::Err(
                IdentityFailure::KeyDerivation(std::string(ErrorMessages::KDF_OUT_OF_MEMORY)));
        }

        auto secret_alloc = SecureMemoryHandle::Allocate(kEd25519SecretKeyBytes);
        if (secret_alloc.IsErr()) {
            return Result<Ed25519KeyPair, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(secret_alloc.UnwrapErr()));
        }
        SecureMemoryHandle secret_key_handle = std::move(secret_alloc).Unwrap();

        PublicKeyBytes public_key{};
        auto expand_result = seed_handle.WithReadAccess([&](std::span<const uint8_t> seed) {
            return secret_key_handle.WithWriteAccess([&](std::span<uint8_t> secret_key) {
                return crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data());
            });
        });
        if (expand_result.IsErr()) {
            return Result<Ed25519KeyPair, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(expand_result.UnwrapErr()));
        }
        if (auto& inner = expand_result.Unwrap(); inner.IsErr() || inner.Unwrap() != 0) {
            return Result<Ed25519KeyPair, IdentityFailure>::Err(
                IdentityFailure::KeyDerivation(std::string(ErrorMessages::SEED_KEYPAIR_FAILED)));
        }

        return Result<Ed25519KeyPair, IdentityFailure>::Ok(
            Ed25519KeyPair(std::move(seed_handle), std::move(secret_key_handle), public_key));
    }

    Result<PublicKeyBytes, IdentityFailure> KeyDerivationService::DerivePublicKey(
        std::string_view email,
        std::string_view passphrase) const {
        auto pair_result = DeriveKeyPair(email, passphrase);
        if (pair_result.IsErr()) {
            return Result<PublicKeyBytes, IdentityFailure>::Err(
                std::move(pair_result).UnwrapErr());
        }
        Ed25519KeyPair key_pair = std::move(pair_result).Unwrap();
        const PublicKeyBytes public_key = key_pair.GetPublicKey();
        key_pair.Wipe();
        return Result<PublicKeyBytes, IdentityFailure>::Ok(public_key);
    }

    Result<std::string, IdentityFailure> KeyDerivationService::SignChallenge(
        const Ed25519KeyPair& key_pair,
        std::string_view nonce) const {
        std::array<uint8_t, kEd25519SignatureBytes> signature{};
        auto sign_result = key_pair.GetSecretKeyHandle().WithReadAccess(
            [&](std::span<const uint8_t> secret_key) {
                return crypto_sign_detached(
                    signature.data(), nullptr,
                    reinterpret_cast<const unsigned char*>(nonce.data()), nonce.size(),
                    secret_key.data());
            });
        if (sign_result.IsErr()) {
            return Result<std::string, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(sign_result.UnwrapErr()));
        }
        if (sign_result.Unwrap() != 0) {
            return Result<std::string, IdentityFailure>::Err(
                IdentityFailure::KeyDerivation(std::string(ErrorMessages::SIGN_FAILED)));
        }
        return Result<std::string, IdentityFailure>::Ok(SodiumInterop::ToBase64(signature));
    }

    bool KeyDerivationService::VerifySignature(
        std::string_view public_key,
        std::string_view signature,
        std::string_view nonce) const {
        const auto public_key_bytes = DecodePublicKey(public_key);
        if (!public_key_bytes.has_value()) {
            return false;
        }
        const auto signature_bytes = SodiumInterop::FromBase64(signature);
        if (!signature_bytes.has_value() || signature_bytes->size() != kEd25519SignatureBytes) {
            return false;
        }
        return crypto_sign_verify_detached(
                   signature_bytes->data(),
                   reinterpret_cast<const unsigned char*>(nonce.data()), nonce.size(),
                   public_key_bytes->data()) == 0;
    }

    EntropyReport KeyDerivationService::ValidatePassphraseEntropy(
        std::string_view passphrase,
        const size_t min_length,
        const size_t min_unique_chars) {
        EntropyReport report;
        auto normalized_result = TextNormalizer::NormalizePassphrase(passphrase);
        if (normalized_result.IsErr()) {
            report.valid = false;
            report.errors.push_back(normalized_result.UnwrapErr().message);
            return report;
        }
        std::string normalized = std::move(normalized_result).Unwrap();
        auto stats_result = TextNormalizer::MeasureGraphemes(normalized);
        WipeSecretText(normalized);
        if (stats_result.IsErr()) {
            report.valid = false;
            report.errors.push_back(stats_result.UnwrapErr().message);
            return report;
        }

        const auto& [length, unique] = stats_result.Unwrap();
        if (length < min_length) {
            report.errors.push_back(
                compat::format("Passphrase must be at least {} characters.", min_length));
        }
        if (unique < min_unique_chars) {
            report.errors.push_back(
                compat::format("Passphrase must contain at least {} unique characters.",
                               min_unique_chars));
        }
        report.valid = report.errors.empty();
        return report;
    }

    std::string KeyDerivationService::EncodePublicKey(const PublicKeyBytes& public_key) {
        return SodiumInterop::ToBase64(public_key);
    }

    std::optional<PublicKeyBytes> KeyDerivationService::DecodePublicKey(std::string_view encoded) {
        const auto decoded = SodiumInterop::FromBase64(encoded);
        if (!decoded.has_value() || decoded->size() != kEd25519PublicKeyBytes) {
            return std::nullopt;
        }
        PublicKeyBytes public_key{};
        std::copy(decoded->begin(), decoded->end(), public_key.begin());
        return public_key;
    }
}
