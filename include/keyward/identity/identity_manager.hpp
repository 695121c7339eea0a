#pragma once

#include "keyward/configuration/identity_config.hpp"
#include "keyward/crypto/key_derivation_service.hpp"
#include "keyward/identity/nonce_service.hpp"
#include "keyward/interfaces/i_identity_event_handler.hpp"
#include "keyward/interfaces/i_identity_record.hpp"
#include "keyward/interfaces/i_identity_store.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::identity {

struct IdentityManagerOptions {
    configuration::EntropyPolicy entropy;
    bool mask_unknown_identities = true;
};

/**
 * @brief Registration, verification and recovery of key-derived identities
 *
 * Only the base64 public key is ever handed to the store. Verification
 * derives a candidate keypair and compares public keys in constant time;
 * seed and private key are wiped on every path.
 */
class IdentityManager {
public:
    /**
     * @return Configuration failure when the key service, nonce service or
     *         store is missing; the event handler is optional
     */
    [[nodiscard]] static Result<IdentityManager, IdentityFailure> Create(
        std::shared_ptr<const crypto::KeyDerivationService> key_service,
        std::shared_ptr<const NonceService> nonce_service,
        std::shared_ptr<interfaces::IIdentityStore> store,
        std::shared_ptr<interfaces::IIdentityEventHandler> event_handler = nullptr,
        IdentityManagerOptions options = {});

    /**
     * @brief Create an identity for a new email
     *
     * @return InvalidInput for an empty email, WeakPassphrase with reasons,
     *         AlreadyRegistered, KeyDerivation or Store
     */
    [[nodiscard]] Result<std::shared_ptr<interfaces::IIdentityRecord>, IdentityFailure> Register(
        std::string_view email,
        std::string_view passphrase,
        std::vector<std::string> prompt_ids = {},
        std::map<std::string, std::string> attributes = {});

    /**
     * @brief Re-derive and compare; nullptr on any failure
     */
    [[nodiscard]] std::shared_ptr<interfaces::IIdentityRecord> Verify(
        std::string_view email,
        std::string_view passphrase) const;

    /**
     * @brief Replace the public key of an identity already authenticated out of band
     *
     * Prompt ids are replaced only when new ones are given.
     */
    [[nodiscard]] Result<Unit, IdentityFailure> Recover(
        interfaces::IIdentityRecord& record,
        std::string_view new_passphrase,
        std::vector<std::string> new_prompt_ids = {});

    /// Nonce bound to the normalized email.
    [[nodiscard]] std::string Challenge(std::string_view email) const;

    [[nodiscard]] const crypto::KeyDerivationService& KeyService() const noexcept {
        return *key_service_;
    }

    [[nodiscard]] const NonceService& Nonces() const noexcept {
        return *nonce_service_;
    }

private:
    IdentityManager(
        std::shared_ptr<const crypto::KeyDerivationService> key_service,
        std::shared_ptr<const NonceService> nonce_service,
        std::shared_ptr<interfaces::IIdentityStore> store,
        std::shared_ptr<interfaces::IIdentityEventHandler> event_handler,
        IdentityManagerOptions options);

    [[nodiscard]] Result<Unit, IdentityFailure> CheckEntropy(std::string_view passphrase) const;

    void RunMaskingDerivation(std::string_view passphrase) const;

    std::shared_ptr<const crypto::KeyDerivationService> key_service_;
    std::shared_ptr<const NonceService> nonce_service_;
    std::shared_ptr<interfaces::IIdentityStore> store_;
    std::shared_ptr<interfaces::IIdentityEventHandler> event_handler_;
    IdentityManagerOptions options_;
};

} // namespace keyward::identity
