#pragma once

#include "keyward/auth/device_trust_manager.hpp"
#include "keyward/auth/guard.hpp"
#include "keyward/auth/key_guard.hpp"
#include "keyward/configuration/identity_config.hpp"
#include "keyward/crypto/key_derivation_service.hpp"
#include "keyward/identity/identity_manager.hpp"
#include "keyward/identity/nonce_service.hpp"
#include "keyward/interfaces/i_clock.hpp"
#include "keyward/interfaces/i_identity_event_handler.hpp"
#include "keyward/interfaces/i_identity_store.hpp"
#include "keyward/security/nonce_replay_ledger.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"

#include <memory>
#include <string>

namespace keyward::identity {

struct IdentityModuleDependencies {
    std::shared_ptr<interfaces::IIdentityStore> identity_store;
    std::shared_ptr<interfaces::IIdentityEventHandler> event_handler;
    std::shared_ptr<const interfaces::IClock> clock;
    std::shared_ptr<security::NonceReplayLedger> replay_ledger;
};

/**
 * @brief Builds the identity services from one IdentityConfig
 *
 * Boot validates the whole configuration up front, so a running module never
 * holds a weak secret or out-of-range KDF cost. Guards are per request and
 * made on demand; the services they share are immutable.
 */
class IdentityModule {
public:
    [[nodiscard]] static bool ShouldBoot(const configuration::IdentityConfig& config) noexcept {
        return config.enabled;
    }

    [[nodiscard]] static Result<IdentityModule, IdentityFailure> Boot(
        configuration::IdentityConfig config,
        IdentityModuleDependencies dependencies);

    /// Unknown drivers are a Configuration failure.
    [[nodiscard]] Result<std::unique_ptr<auth::IGuard>, IdentityFailure> MakeGuard(
        const configuration::GuardConfig& guard_config) const;

    [[nodiscard]] Result<std::unique_ptr<auth::KeyGuard>, IdentityFailure> MakeKeyGuard(
        std::string name = {}) const;

    [[nodiscard]] Result<auth::DeviceTrustManager, IdentityFailure> MakeDeviceTrustManager(
        std::shared_ptr<interfaces::IDeviceTokenStore> token_store,
        std::shared_ptr<interfaces::ISessionStore> session_store,
        std::shared_ptr<interfaces::ITrustCookieJar> cookie_jar) const;

    [[nodiscard]] IdentityManager& Identities() noexcept {
        return identity_manager_;
    }

    [[nodiscard]] const IdentityManager& Identities() const noexcept {
        return identity_manager_;
    }

    [[nodiscard]] std::shared_ptr<const crypto::KeyDerivationService> KeyService() const noexcept {
        return key_service_;
    }

    [[nodiscard]] std::shared_ptr<const NonceService> Nonces() const noexcept {
        return nonce_service_;
    }

    [[nodiscard]] std::shared_ptr<security::NonceReplayLedger> ReplayLedger() const noexcept {
        return dependencies_.replay_ledger;
    }

    [[nodiscard]] const configuration::IdentityConfig& Config() const noexcept {
        return config_;
    }

private:
    IdentityModule(
        configuration::IdentityConfig config,
        IdentityModuleDependencies dependencies,
        std::shared_ptr<const crypto::KeyDerivationService> key_service,
        std::shared_ptr<const NonceService> nonce_service,
        IdentityManager identity_manager);

    configuration::IdentityConfig config_;
    IdentityModuleDependencies dependencies_;
    std::shared_ptr<const crypto::KeyDerivationService> key_service_;
    std::shared_ptr<const NonceService> nonce_service_;
    IdentityManager identity_manager_;
};

} // namespace keyward::identity
