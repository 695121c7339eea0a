#include "keyward/identity/identity_module.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/debug/auth_trace.hpp"

namespace keyward::identity {
    using configuration::IdentityConfig;
    using configuration::GuardConfig;
    using configuration::GuardDriver;
    using crypto::KeyDerivationService;
    using auth::IGuard;
    using auth::KeyGuard;
    using auth::KeyGuardDependencies;
    using auth::DeviceTrustManager;
    using debug::Component;

    IdentityModule::IdentityModule(
        IdentityConfig config,
        IdentityModuleDependencies dependencies,
        std::shared_ptr<const KeyDerivationService> key_service,
        std::shared_ptr<const NonceService> nonce_service,
        IdentityManager identity_manager)
        : config_(std::move(config))
          , dependencies_(std::move(dependencies))
          , key_service_(std::move(key_service))
          , nonce_service_(std::move(nonce_service))
          , identity_manager_(std::move(identity_manager)) {
    }

    Result<IdentityModule, IdentityFailure> IdentityModule::Boot(
        IdentityConfig config,
        IdentityModuleDependencies dependencies) {
        if (!ShouldBoot(config)) {
            return Result<IdentityModule, IdentityFailure>::Err(
                IdentityFailure::Configuration("Identity module is disabled"));
        }
        if (auto config_result = config.Validate(); config_result.IsErr()) {
            return Result<IdentityModule, IdentityFailure>::Err(
                std::move(config_result).UnwrapErr());
        }
        if (!dependencies.identity_store) {
            return Result<IdentityModule, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::MISSING_IDENTITY_STORE)));
        }
        if (dependencies.replay_ledger &&
            dependencies.replay_ledger->Lifetime() < config.nonce.ttl + config.nonce.max_clock_skew) {
            return Result<IdentityModule, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::REPLAY_LEDGER_TOO_SHORT)));
        }
        if (!dependencies.clock) {
            dependencies.clock = std::make_shared<interfaces::SystemClock>();
        }

        KEYWARD_TRACE_SECTION(Component::Module, "BOOT");
        auto key_service_result = KeyDerivationService::Create(config.kdf);
        if (key_service_result.IsErr()) {
            return Result<IdentityModule, IdentityFailure>::Err(
                std::move(key_service_result).UnwrapErr());
        }
        auto key_service = std::make_shared<const KeyDerivationService>(
            std::move(key_service_result).Unwrap());

        auto nonce_result = NonceService::Create(config.nonce, dependencies.clock);
        if (nonce_result.IsErr()) {
            return Result<IdentityModule, IdentityFailure>::Err(
                std::move(nonce_result).UnwrapErr());
        }
        auto nonce_service = std::make_shared<const NonceService>(
            std::move(nonce_result).Unwrap());

        auto manager_result = IdentityManager::Create(
            key_service,
            nonce_service,
            dependencies.identity_store,
            dependencies.event_handler,
            IdentityManagerOptions{
                .entropy = config.entropy,
                .mask_unknown_identities = config.mask_unknown_identities
            });
        if (manager_result.IsErr()) {
            return Result<IdentityModule, IdentityFailure>::Err(
                std::move(manager_result).UnwrapErr());
        }

        // The secret now lives in secure memory only.
        if (auto wipe_result = crypto::SodiumInterop::SecureWipe(config.nonce.secret); wipe_result.IsErr()) {
            return Result<IdentityModule, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(wipe_result.UnwrapErr()));
        }
        return Result<IdentityModule, IdentityFailure>::Ok(IdentityModule(
            std::move(config),
            std::move(dependencies),
            std::move(key_service),
            std::move(nonce_service),
            std::move(manager_result).Unwrap()));
    }

    Result<std::unique_ptr<IGuard>, IdentityFailure> IdentityModule::MakeGuard(
        const GuardConfig& guard_config) const {
        switch (guard_config.driver) {
            case GuardDriver::Key: {
                auto guard_result = MakeKeyGuard(guard_config.name);
                if (guard_result.IsErr()) {
                    return Result<std::unique_ptr<IGuard>, IdentityFailure>::Err(
                        std::move(guard_result).UnwrapErr());
                }
                return Result<std::unique_ptr<IGuard>, IdentityFailure>::Ok(
                    std::move(guard_result).Unwrap());
            }
        }
        return Result<std::unique_ptr<IGuard>, IdentityFailure>::Err(
            IdentityFailure::Configuration(compat::format(
                "Unsupported guard driver {}", static_cast<int>(guard_config.driver))));
    }

    Result<std::unique_ptr<KeyGuard>, IdentityFailure> IdentityModule::MakeKeyGuard(
        std::string name) const {
        if (name.empty()) {
            name = config_.guard.name;
        }
        return KeyGuard::Create(
            std::move(name),
            KeyGuardDependencies{
                .key_service = key_service_,
                .nonce_service = nonce_service_,
                .store = dependencies_.identity_store,
                .event_handler = dependencies_.event_handler,
                .replay_ledger = dependencies_.replay_ledger
            },
            config_.mask_unknown_identities);
    }

    Result<DeviceTrustManager, IdentityFailure> IdentityModule::MakeDeviceTrustManager(
        std::shared_ptr<interfaces::IDeviceTokenStore> token_store,
        std::shared_ptr<interfaces::ISessionStore> session_store,
        std::shared_ptr<interfaces::ITrustCookieJar> cookie_jar) const {
        return DeviceTrustManager::Create(
            config_.trust,
            std::move(token_store),
            std::move(session_store),
            std::move(cookie_jar),
            dependencies_.clock);
    }
}
