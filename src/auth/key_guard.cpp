#include "keyward/auth/key_guard.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/crypto/text_normalizer.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/debug/auth_trace.hpp"

namespace keyward::identity::auth {
    using crypto::KeyDerivationService;
    using crypto::SodiumInterop;
    using crypto::TextNormalizer;
    using interfaces::IIdentityRecord;
    using debug::Component;

    KeyGuard::KeyGuard(
        std::string name,
        KeyGuardDependencies dependencies,
        const bool mask_unknown_identities)
        : name_(std::move(name))
          , deps_(std::move(dependencies))
          , mask_unknown_identities_(mask_unknown_identities) {
    }

    Result<std::unique_ptr<KeyGuard>, IdentityFailure> KeyGuard::Create(
        std::string name,
        KeyGuardDependencies dependencies,
        const bool mask_unknown_identities) {
        if (!dependencies.key_service || !dependencies.nonce_service) {
            return Result<std::unique_ptr<KeyGuard>, IdentityFailure>::Err(
                IdentityFailure::Configuration("Key guard requires key derivation and nonce services"));
        }
        if (!dependencies.store) {
            return Result<std::unique_ptr<KeyGuard>, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::MISSING_IDENTITY_STORE)));
        }
        if (dependencies.replay_ledger &&
            dependencies.replay_ledger->Lifetime() <
            dependencies.nonce_service->Ttl() + dependencies.nonce_service->MaxClockSkew()) {
            return Result<std::unique_ptr<KeyGuard>, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::REPLAY_LEDGER_TOO_SHORT)));
        }
        if (name.empty()) {
            name = std::string(kDefaultGuardName);
        }
        auto guard = std::unique_ptr<KeyGuard>(
            new KeyGuard(std::move(name), std::move(dependencies), mask_unknown_identities));
        return Result<std::unique_ptr<KeyGuard>, IdentityFailure>::Ok(std::move(guard));
    }

    bool KeyGuard::Check() const {
        return state_ == GuardState::Authenticated && user_ != nullptr;
    }

    bool KeyGuard::Guest() const {
        return !Check();
    }

    std::shared_ptr<IIdentityRecord> KeyGuard::User() const {
        return Check() ? user_ : nullptr;
    }

    std::optional<std::string> KeyGuard::Id() const {
        if (!Check()) {
            return std::nullopt;
        }
        return user_->GetAuthIdentifier();
    }

    bool KeyGuard::Validate(const Credentials& credentials) const {
        if (credentials.email.empty() || credentials.passphrase.empty()) {
            return false;
        }
        const std::string normalized_email = TextNormalizer::NormalizeEmail(credentials.email);
        return ResolveCredentials(normalized_email, credentials.passphrase) != nullptr;
    }

    bool KeyGuard::Attempt(const Credentials& credentials) {
        const std::string normalized_email = TextNormalizer::NormalizeEmail(credentials.email);
        NotifyAttempting(normalized_email);

        std::shared_ptr<IIdentityRecord> record;
        if (!normalized_email.empty() && !credentials.passphrase.empty()) {
            record = ResolveCredentials(normalized_email, credentials.passphrase);
        }
        if (!record) {
            KEYWARD_TRACE(Component::Guard, "Attempt", "{} failed", name_);
            NotifyFailed(normalized_email);
            return false;
        }

        Login(record);
        NotifySucceeded(*record);
        return true;
    }

    void KeyGuard::Login(std::shared_ptr<IIdentityRecord> record) {
        if (!record) {
            Logout();
            return;
        }
        user_ = std::move(record);
        state_ = GuardState::Authenticated;
    }

    void KeyGuard::SetUser(std::shared_ptr<IIdentityRecord> record) {
        Login(std::move(record));
    }

    void KeyGuard::Logout() {
        user_.reset();
        state_ = GuardState::Anonymous;
    }

    std::string KeyGuard::Challenge(const std::string_view identifier) {
        user_.reset();
        state_ = GuardState::Pending;
        return deps_.nonce_service->Generate(TextNormalizer::NormalizeEmail(identifier));
    }

    bool KeyGuard::AuthenticateWithSignature(
        const std::string_view email,
        const std::string_view signature,
        const std::string_view nonce) {
        const std::string normalized_email = TextNormalizer::NormalizeEmail(email);
        NotifyAttempting(normalized_email);

        auto record = ResolveSignature(normalized_email, signature, nonce);
        if (!record) {
            KEYWARD_TRACE(Component::Guard, "AuthenticateWithSignature", "{} rejected", name_);
            user_.reset();
            state_ = GuardState::Rejected;
            NotifyFailed(normalized_email);
            return false;
        }

        Login(record);
        NotifySucceeded(*record);
        return true;
    }

    std::shared_ptr<IIdentityRecord> KeyGuard::ResolveCredentials(
        const std::string& normalized_email,
        const std::string_view passphrase) const {
        if (normalized_email.empty()) {
            return nullptr;
        }
        std::shared_ptr<IIdentityRecord> record = deps_.store->FindByIdentifier(normalized_email);
        const std::string stored_public_key = record ? record->GetPublicKey() : std::string();
        const auto stored_key = KeyDerivationService::DecodePublicKey(stored_public_key);
        if (!stored_key.has_value()) {
            if (mask_unknown_identities_) {
                auto masked = deps_.key_service->DeriveKeyPair(kUnknownIdentityPlaceholder, passphrase);
                if (masked.IsOk()) {
                    masked.Unwrap().Wipe();
                }
            }
            return nullptr;
        }

        auto pair_result = deps_.key_service->DeriveKeyPair(normalized_email, passphrase);
        if (pair_result.IsErr()) {
            return nullptr;
        }
        auto& key_pair = pair_result.Unwrap();

        auto equal = SodiumInterop::ConstantTimeEquals(
            std::span<const uint8_t>(key_pair.GetPublicKey()),
            std::span<const uint8_t>(*stored_key));
        if (equal.IsErr() || !equal.Unwrap()) {
            key_pair.Wipe();
            return nullptr;
        }

        const std::string nonce = deps_.nonce_service->Generate(normalized_email);
        auto signature = deps_.key_service->SignChallenge(key_pair, nonce);
        key_pair.Wipe();
        if (signature.IsErr()) {
            return nullptr;
        }
        if (!deps_.key_service->VerifySignature(stored_public_key, signature.Unwrap(), nonce)) {
            return nullptr;
        }
        return record;
    }

    std::shared_ptr<IIdentityRecord> KeyGuard::ResolveSignature(
        const std::string& normalized_email,
        const std::string_view signature,
        const std::string_view nonce) const {
        if (normalized_email.empty()) {
            return nullptr;
        }
        if (!deps_.nonce_service->Validate(normalized_email, nonce)) {
            return nullptr;
        }
        std::shared_ptr<IIdentityRecord> record = deps_.store->FindByIdentifier(normalized_email);
        if (!record) {
            return nullptr;
        }
        if (!deps_.key_service->VerifySignature(record->GetPublicKey(), signature, nonce)) {
            return nullptr;
        }
        if (deps_.replay_ledger) {
            if (auto consumed = deps_.replay_ledger->Consume(normalized_email, nonce); consumed.IsErr()) {
                KEYWARD_TRACE(Component::Guard, "AuthenticateWithSignature", "nonce replayed");
                return nullptr;
            }
        }
        return record;
    }

    void KeyGuard::NotifyAttempting(const std::string& email) const {
        if (deps_.event_handler) {
            deps_.event_handler->OnAuthAttempting(name_, email);
        }
    }

    void KeyGuard::NotifySucceeded(const IIdentityRecord& record) const {
        if (deps_.event_handler) {
            deps_.event_handler->OnAuthSucceeded(name_, record);
        }
    }

    void KeyGuard::NotifyFailed(const std::string& email) const {
        if (deps_.event_handler) {
            deps_.event_handler->OnAuthFailed(name_, email);
        }
    }
}
