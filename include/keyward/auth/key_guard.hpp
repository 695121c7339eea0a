#pragma once

#include "keyward/auth/guard.hpp"
#include "keyward/crypto/key_derivation_service.hpp"
#include "keyward/identity/nonce_service.hpp"
#include "keyward/interfaces/i_identity_event_handler.hpp"
#include "keyward/interfaces/i_identity_store.hpp"
#include "keyward/security/nonce_replay_ledger.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace keyward::identity::auth {

struct KeyGuardDependencies {
    std::shared_ptr<const crypto::KeyDerivationService> key_service;
    std::shared_ptr<const NonceService> nonce_service;
    std::shared_ptr<interfaces::IIdentityStore> store;
    std::shared_ptr<interfaces::IIdentityEventHandler> event_handler;
    // Optional. When set, a signed nonce is accepted once.
    std::shared_ptr<security::NonceReplayLedger> replay_ledger;
};

/**
 * @brief Guard that authenticates by proving possession of the derived key
 *
 * Two flows:
 *   - Attempt(credentials): the server derives the keypair itself, checks the
 *     public key and signs and verifies a fresh nonce.
 *   - Challenge(email) then AuthenticateWithSignature(...): the client derives
 *     and signs; the server only ever sees the signature.
 *
 * Anonymous -> Pending -> Authenticated, or -> Rejected on a failed
 * signature. Not thread-safe; one instance per request.
 */
class KeyGuard final : public IGuard {
public:
    [[nodiscard]] static Result<std::unique_ptr<KeyGuard>, IdentityFailure> Create(
        std::string name,
        KeyGuardDependencies dependencies,
        bool mask_unknown_identities = true);

    [[nodiscard]] bool Check() const override;
    [[nodiscard]] bool Guest() const override;
    [[nodiscard]] std::shared_ptr<interfaces::IIdentityRecord> User() const override;
    [[nodiscard]] std::optional<std::string> Id() const override;
    [[nodiscard]] bool Validate(const Credentials& credentials) const override;
    bool Attempt(const Credentials& credentials) override;
    void Login(std::shared_ptr<interfaces::IIdentityRecord> record) override;
    void Logout() override;
    void SetUser(std::shared_ptr<interfaces::IIdentityRecord> record) override;

    [[nodiscard]] const std::string& Name() const noexcept override {
        return name_;
    }

    [[nodiscard]] GuardState State() const noexcept override {
        return state_;
    }

    /// Issue a nonce for the normalized identifier and move to Pending.
    [[nodiscard]] std::string Challenge(std::string_view identifier);

    [[nodiscard]] bool AuthenticateWithSignature(
        std::string_view email,
        std::string_view signature,
        std::string_view nonce);

private:
    KeyGuard(std::string name, KeyGuardDependencies dependencies, bool mask_unknown_identities);

    [[nodiscard]] std::shared_ptr<interfaces::IIdentityRecord> ResolveCredentials(
        const std::string& normalized_email,
        std::string_view passphrase) const;

    [[nodiscard]] std::shared_ptr<interfaces::IIdentityRecord> ResolveSignature(
        const std::string& normalized_email,
        std::string_view signature,
        std::string_view nonce) const;

    void NotifyAttempting(const std::string& email) const;
    void NotifySucceeded(const interfaces::IIdentityRecord& record) const;
    void NotifyFailed(const std::string& email) const;

    std::string name_;
    KeyGuardDependencies deps_;
    bool mask_unknown_identities_;
    GuardState state_ = GuardState::Anonymous;
    std::shared_ptr<interfaces::IIdentityRecord> user_;
};

} // namespace keyward::identity::auth
