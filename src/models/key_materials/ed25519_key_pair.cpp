#include "keyward/models/key_materials/ed25519_key_pair.hpp"

namespace keyward::identity::models {
    Ed25519KeyPair::Ed25519KeyPair(
        crypto::SecureMemoryHandle seed_handle,
        crypto::SecureMemoryHandle secret_key_handle,
        const PublicKeyBytes& public_key)
        : seed_handle_(std::move(seed_handle))
          , secret_key_handle_(std::move(secret_key_handle))
          , public_key_(public_key) {
    }

    Ed25519KeyPair::~Ed25519KeyPair() {
        Wipe();
    }

    void Ed25519KeyPair::Wipe() noexcept {
        seed_handle_.Release();
        secret_key_handle_.Release();
    }
}
