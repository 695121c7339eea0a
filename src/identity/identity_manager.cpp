#include "keyward/identity/identity_manager.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/crypto/text_normalizer.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/debug/auth_trace.hpp"

#include <sodium.h>

namespace keyward::identity {
    using crypto::KeyDerivationService;
    using crypto::SodiumInterop;
    using crypto::TextNormalizer;
    using interfaces::IIdentityRecord;
    using interfaces::IIdentityStore;
    using interfaces::IIdentityEventHandler;
    using models::IdentityFields;
    using models::PublicKeyBytes;
    using debug::Component;

    IdentityManager::IdentityManager(
        std::shared_ptr<const KeyDerivationService> key_service,
        std::shared_ptr<const NonceService> nonce_service,
        std::shared_ptr<IIdentityStore> store,
        std::shared_ptr<IIdentityEventHandler> event_handler,
        IdentityManagerOptions options)
        : key_service_(std::move(key_service))
          , nonce_service_(std::move(nonce_service))
          , store_(std::move(store))
          , event_handler_(std::move(event_handler))
          , options_(options) {
    }

    Result<IdentityManager, IdentityFailure> IdentityManager::Create(
        std::shared_ptr<const KeyDerivationService> key_service,
        std::shared_ptr<const NonceService> nonce_service,
        std::shared_ptr<IIdentityStore> store,
        std::shared_ptr<IIdentityEventHandler> event_handler,
        IdentityManagerOptions options) {
        if (!key_service || !nonce_service) {
            return Result<IdentityManager, IdentityFailure>::Err(
                IdentityFailure::Configuration("Key derivation and nonce services are required"));
        }
        if (!store) {
            return Result<IdentityManager, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::MISSING_IDENTITY_STORE)));
        }
        return Result<IdentityManager, IdentityFailure>::Ok(IdentityManager(
            std::move(key_service),
            std::move(nonce_service),
            std::move(store),
            std::move(event_handler),
            options));
    }

    Result<Unit, IdentityFailure> IdentityManager::CheckEntropy(std::string_view passphrase) const {
        auto report = KeyDerivationService::ValidatePassphraseEntropy(
            passphrase,
            options_.entropy.min_length,
            options_.entropy.min_unique_chars);
        if (!report.valid) {
            return Result<Unit, IdentityFailure>::Err(
                IdentityFailure::WeakPassphrase(std::move(report.errors)));
        }
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

    Result<std::shared_ptr<IIdentityRecord>, IdentityFailure> IdentityManager::Register(
        std::string_view email,
        std::string_view passphrase,
        std::vector<std::string> prompt_ids,
        std::map<std::string, std::string> attributes) {
        using RegisterResult = Result<std::shared_ptr<IIdentityRecord>, IdentityFailure>;

        std::string normalized_email = TextNormalizer::NormalizeEmail(email);
        if (normalized_email.empty()) {
            return RegisterResult::Err(
                IdentityFailure::InvalidInput(std::string(ErrorMessages::EMAIL_REQUIRED)));
        }
        if (auto entropy_result = CheckEntropy(passphrase); entropy_result.IsErr()) {
            KEYWARD_TRACE(Component::Identity, "Register", "rejected: weak passphrase");
            return RegisterResult::Err(std::move(entropy_result).UnwrapErr());
        }
        if (store_->FindByIdentifier(normalized_email)) {
            return RegisterResult::Err(
                IdentityFailure::AlreadyRegistered(std::string(ErrorMessages::IDENTITY_EXISTS)));
        }

        auto derive_result = key_service_->DerivePublicKey(normalized_email, passphrase);
        if (derive_result.IsErr()) {
            return RegisterResult::Err(std::move(derive_result).UnwrapErr());
        }
        PublicKeyBytes& public_key = derive_result.Unwrap();
        const std::string encoded_public_key = KeyDerivationService::EncodePublicKey(public_key);
        sodium_memzero(public_key.data(), public_key.size());

        auto create_result = store_->Create(IdentityFields{
            .email = std::move(normalized_email),
            .public_key = encoded_public_key,
            .prompt_ids = std::move(prompt_ids),
            .attributes = std::move(attributes)
        });
        if (create_result.IsErr()) {
            IdentityFailure failure = std::move(create_result).UnwrapErr();
            if (failure.Is(IdentityFailureType::AlreadyRegistered)) {
                return RegisterResult::Err(std::move(failure));
            }
            return RegisterResult::Err(IdentityFailure::Store(std::move(failure.message)));
        }
        std::shared_ptr<IIdentityRecord> record = std::move(create_result).Unwrap();
        if (!record) {
            return RegisterResult::Err(
                IdentityFailure::Store("Identity store returned no record"));
        }

        KEYWARD_TRACE(Component::Identity, "Register", "created identity {}", record->GetAuthIdentifier());
        if (event_handler_) {
            event_handler_->OnIdentityRegistered(*record, encoded_public_key);
        }
        return RegisterResult::Ok(std::move(record));
    }

    std::shared_ptr<IIdentityRecord> IdentityManager::Verify(
        std::string_view email,
        std::string_view passphrase) const {
        const std::string normalized_email = TextNormalizer::NormalizeEmail(email);
        if (normalized_email.empty()) {
            return nullptr;
        }

        std::shared_ptr<IIdentityRecord> record = store_->FindByIdentifier(normalized_email);
        std::optional<PublicKeyBytes> stored_key;
        if (record) {
            stored_key = KeyDerivationService::DecodePublicKey(record->GetPublicKey());
        }
        if (!stored_key.has_value()) {
            KEYWARD_TRACE(Component::Identity, "Verify", "no usable identity");
            RunMaskingDerivation(passphrase);
            return nullptr;
        }

        auto pair_result = key_service_->DeriveKeyPair(normalized_email, passphrase);
        if (pair_result.IsErr()) {
            return nullptr;
        }
        auto& key_pair = pair_result.Unwrap();
        auto equal = SodiumInterop::ConstantTimeEquals(
            std::span<const uint8_t>(key_pair.GetPublicKey()),
            std::span<const uint8_t>(*stored_key));
        key_pair.Wipe();

        if (equal.IsErr() || !equal.Unwrap()) {
            KEYWARD_TRACE(Component::Identity, "Verify", "public key mismatch");
            return nullptr;
        }
        return record;
    }

    void IdentityManager::RunMaskingDerivation(std::string_view passphrase) const {
        if (!options_.mask_unknown_identities) {
            return;
        }
        auto masked = key_service_->DeriveKeyPair(kUnknownIdentityPlaceholder, passphrase);
        if (masked.IsOk()) {
            masked.Unwrap().Wipe();
        }
    }

    Result<Unit, IdentityFailure> IdentityManager::Recover(
        IIdentityRecord& record,
        std::string_view new_passphrase,
        std::vector<std::string> new_prompt_ids) {
        if (auto entropy_result = CheckEntropy(new_passphrase); entropy_result.IsErr()) {
            return entropy_result;
        }

        auto derive_result = key_service_->DerivePublicKey(record.GetEmail(), new_passphrase);
        if (derive_result.IsErr()) {
            return Result<Unit, IdentityFailure>::Err(std::move(derive_result).UnwrapErr());
        }
        PublicKeyBytes& public_key = derive_result.Unwrap();
        const std::string encoded_public_key = KeyDerivationService::EncodePublicKey(public_key);
        sodium_memzero(public_key.data(), public_key.size());

        const std::string previous_public_key = record.GetPublicKey();
        const std::vector<std::string> previous_prompt_ids = record.GetPromptIds();
        record.SetPublicKey(encoded_public_key);
        if (!new_prompt_ids.empty()) {
            record.SetPromptIds(new_prompt_ids);
        }
        if (auto save_result = store_->Save(record); save_result.IsErr()) {
            // Unsaved changes must not leak into stores that share record objects.
            record.SetPublicKey(previous_public_key);
            record.SetPromptIds(previous_prompt_ids);
            return Result<Unit, IdentityFailure>::Err(
                IdentityFailure::Store(std::move(save_result).UnwrapErr().message));
        }

        KEYWARD_TRACE(Component::Identity, "Recover", "rotated key for {}", record.GetAuthIdentifier());
        if (event_handler_) {
            event_handler_->OnIdentityRecovered(record, encoded_public_key);
        }
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

    std::string IdentityManager::Challenge(std::string_view email) const {
        return nonce_service_->Generate(TextNormalizer::NormalizeEmail(email));
    }
}
