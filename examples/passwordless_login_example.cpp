/**
 * @file passwordless_login_example.cpp
 * @brief Register an identity, sign in with a signed challenge and trust the device
 */

#include "keyward/identity/identity_module.hpp"
#include "keyward/models/identity_fields.hpp"

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include <string>

using namespace keyward::identity;
using namespace keyward::identity::auth;

namespace {

class ExampleRecord final : public interfaces::IIdentityRecord {
public:
    ExampleRecord(std::string id, models::IdentityFields fields)
        : id_(std::move(id)), fields_(std::move(fields)) {}

    std::string GetAuthIdentifier() const override { return id_; }
    std::string GetEmail() const override { return fields_.email; }
    std::string GetPublicKey() const override { return fields_.public_key; }
    void SetPublicKey(const std::string& public_key) override { fields_.public_key = public_key; }
    std::vector<std::string> GetPromptIds() const override { return fields_.prompt_ids; }
    void SetPromptIds(const std::vector<std::string>& prompt_ids) override { fields_.prompt_ids = prompt_ids; }

private:
    std::string id_;
    models::IdentityFields fields_;
};

class ExampleStore final : public interfaces::IIdentityStore {
public:
    std::shared_ptr<interfaces::IIdentityRecord> FindByIdentifier(const std::string& email) override {
        const auto it = records_.find(email);
        return it == records_.end() ? nullptr : it->second;
    }

    Result<std::shared_ptr<interfaces::IIdentityRecord>, IdentityFailure> Create(
        const models::IdentityFields& fields) override {
        auto record = std::make_shared<ExampleRecord>(std::to_string(records_.size() + 1), fields);
        records_[fields.email] = record;
        return Result<std::shared_ptr<interfaces::IIdentityRecord>, IdentityFailure>::Ok(record);
    }

    Result<Unit, IdentityFailure> Save(interfaces::IIdentityRecord&) override {
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

private:
    std::map<std::string, std::shared_ptr<ExampleRecord>> records_;
};

class ExampleTokenStore final : public interfaces::IDeviceTokenStore {
public:
    Result<Unit, IdentityFailure> ReplaceForUser(const models::DeviceToken& token) override {
        std::erase_if(tokens_, [&](const auto& entry) { return entry.second.user_id == token.user_id; });
        tokens_[token.token_hash] = token;
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

    std::optional<models::DeviceToken> FindValidToken(
        const std::string& token_hash,
        const std::chrono::system_clock::time_point now) override {
        const auto it = tokens_.find(token_hash);
        if (it == tokens_.end() || it->second.IsExpiredAt(now)) {
            return std::nullopt;
        }
        return it->second;
    }

    Result<Unit, IdentityFailure> TouchLastUsed(
        const std::string& token_hash,
        const std::optional<std::string>& ip,
        const std::chrono::system_clock::time_point now) override {
        if (auto it = tokens_.find(token_hash); it != tokens_.end()) {
            it->second.last_used_at = now;
            if (ip.has_value()) {
                it->second.ip = *ip;
            }
        }
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

private:
    std::map<std::string, models::DeviceToken> tokens_;
};

class ExampleSessionStore final : public interfaces::ISessionStore {
public:
    Result<size_t, IdentityFailure> InvalidateOtherSessions(
        const std::string&, const std::optional<std::string>&) override {
        return Result<size_t, IdentityFailure>::Ok(0);
    }
};

class ExampleCookieJar final : public interfaces::ITrustCookieJar {
public:
    std::optional<std::string> Get(const std::string& name) const override {
        const auto it = cookies_.find(name);
        if (it == cookies_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void Queue(const TrustCookie& cookie) override {
        std::cout << "   Set-Cookie: " << cookie.ToHeaderValue() << std::endl;
        cookies_[cookie.name] = cookie.value;
    }

private:
    std::map<std::string, std::string> cookies_;
};

}

int main() {
    std::cout << "=== Keyward - Passwordless Login Example ===" << std::endl;
    std::cout << std::endl;

    auto config = configuration::IdentityConfig::WithSecret("example-application-secret-change-me");
    config.kdf = configuration::KdfConfig::Interactive();

    std::cout << "1. Booting identity module..." << std::endl;
    auto module_result = IdentityModule::Boot(std::move(config), IdentityModuleDependencies{
        .identity_store = std::make_shared<ExampleStore>(),
        .replay_ledger = std::make_shared<security::NonceReplayLedger>()});
    if (module_result.IsErr()) {
        std::cerr << "Failed to boot: " << module_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto module = std::move(module_result).Unwrap();
    std::cout << std::endl;

    const std::string email = "alice@example.com";
    const std::string passphrase = "correct horse battery staple 9!";

    std::cout << "2. Registering " << email << "..." << std::endl;
    auto registered = module.Identities().Register(email, passphrase);
    if (registered.IsErr()) {
        std::cerr << "Registration failed: " << registered.UnwrapErr().message << std::endl;
        for (const auto& reason : registered.UnwrapErr().reasons) {
            std::cerr << "   - " << reason << std::endl;
        }
        return 1;
    }
    auto record = std::move(registered).Unwrap();
    std::cout << "   Public key: " << record->GetPublicKey() << std::endl;
    std::cout << std::endl;

    std::cout << "3. Signing a server challenge..." << std::endl;
    auto guard_result = module.MakeKeyGuard();
    if (guard_result.IsErr()) {
        std::cerr << "Guard unavailable: " << guard_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto guard = std::move(guard_result).Unwrap();
    const std::string nonce = guard->Challenge(email);
    std::cout << "   Nonce: " << nonce << std::endl;

    auto key_pair_result = module.KeyService()->DeriveKeyPair(email, passphrase);
    if (key_pair_result.IsErr()) {
        std::cerr << "Derivation failed: " << key_pair_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto& key_pair = key_pair_result.Unwrap();
    auto signature = module.KeyService()->SignChallenge(key_pair, nonce);
    key_pair.Wipe();
    if (signature.IsErr()) {
        std::cerr << "Signing failed: " << signature.UnwrapErr().message << std::endl;
        return 1;
    }

    const bool signed_in = guard->AuthenticateWithSignature(email, signature.Unwrap(), nonce);
    std::cout << "   Signed in: " << (signed_in ? "yes" : "no") << std::endl;
    const bool replayed = module.MakeKeyGuard().Unwrap()->AuthenticateWithSignature(
        email, signature.Unwrap(), nonce);
    std::cout << "   Replay accepted: " << (replayed ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    std::cout << "4. Trusting this device..." << std::endl;
    auto trust_result = module.MakeDeviceTrustManager(
        std::make_shared<ExampleTokenStore>(),
        std::make_shared<ExampleSessionStore>(),
        std::make_shared<ExampleCookieJar>());
    if (trust_result.IsErr()) {
        std::cerr << "Trust manager unavailable: " << trust_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto& trust = trust_result.Unwrap();
    auto issued = trust.Trust(*record, TrustContext{
        .user_agent = "Mozilla/5.0 (X11; Linux x86_64; rv:121.0) Gecko/20100101 Firefox/121.0",
        .secure_transport = true});
    if (issued.IsErr()) {
        std::cerr << "Trust failed: " << issued.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Device: " << issued.Unwrap().record.device_name << std::endl;
    std::cout << "   Trusted: " << (trust.IsTrusted(*record) ? "yes" : "no") << std::endl;

    return signed_in && !replayed ? 0 : 1;
}
