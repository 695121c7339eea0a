#pragma once
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/core/constants.hpp"
#include <array>
#include <cstdint>
namespace keyward::identity::models {
using PublicKeyBytes = std::array<uint8_t, kEd25519PublicKeyBytes>;
// Ephemeral keypair produced by a single derivation. Seed and secret key are
// zeroed by Wipe() or, at the latest, by the destructor.
class Ed25519KeyPair {
public:
    Ed25519KeyPair(
        crypto::SecureMemoryHandle seed_handle,
        crypto::SecureMemoryHandle secret_key_handle,
        const PublicKeyBytes& public_key);
    ~Ed25519KeyPair();
    Ed25519KeyPair(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSeedHandle() const noexcept {
        return seed_handle_;
    }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const PublicKeyBytes& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] bool IsWiped() const noexcept {
        return seed_handle_.IsInvalid() && secret_key_handle_.IsInvalid();
    }
    void Wipe() noexcept;
private:
    crypto::SecureMemoryHandle seed_handle_;
    crypto::SecureMemoryHandle secret_key_handle_;
    PublicKeyBytes public_key_;
};
}
