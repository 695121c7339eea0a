#include "keyward/auth/device_trust_manager.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/debug/auth_trace.hpp"

#include <algorithm>
#include <map>
#include <regex>

namespace keyward::identity::auth {
    using crypto::SodiumInterop;
    using configuration::TrustConfig;
    using interfaces::IIdentityRecord;
    using models::DeviceToken;
    using models::IssuedDeviceToken;
    using debug::Component;

    namespace {
        std::string UnderscoresToDots(std::string version) {
            std::replace(version.begin(), version.end(), '_', '.');
            return version;
        }

        std::string ParseBrowser(const std::string& user_agent) {
            static const std::regex edge(R"((Edge|Edg)/([\d.]+))");
            static const std::regex chrome(R"((Chrome|CriOS)/([\d.]+))");
            static const std::regex firefox(R"((Firefox|FxiOS)/([\d.]+))");
            static const std::regex safari(R"(Safari/([\d.]+))");

            std::smatch match;
            if (std::regex_search(user_agent, match, edge)) {
                return "Edge " + match[2].str();
            }
            if (std::regex_search(user_agent, match, chrome)) {
                return "Chrome " + match[2].str();
            }
            if (std::regex_search(user_agent, match, firefox)) {
                return "Firefox " + match[2].str();
            }
            if (std::regex_search(user_agent, match, safari)) {
                return "Safari " + match[1].str();
            }
            return "Browser";
        }

        std::string ParseOperatingSystem(const std::string& user_agent) {
            static const std::regex windows(R"(Windows NT ([\d.]+))");
            static const std::regex mac(R"(Mac OS X ([\d_]+))");
            static const std::regex android(R"(Android ([\d.]+))");
            static const std::regex iphone(R"(iPhone OS ([\d_]+))");
            static const std::map<std::string, std::string> windows_versions = {
                {"10.0", "Windows 10/11"},
                {"6.3", "Windows 8.1"},
                {"6.2", "Windows 8"},
                {"6.1", "Windows 7"}
            };

            std::smatch match;
            if (std::regex_search(user_agent, match, windows)) {
                const std::string nt_version = match[1].str();
                if (const auto it = windows_versions.find(nt_version); it != windows_versions.end()) {
                    return it->second;
                }
                return compat::format("Windows (NT {})", nt_version);
            }
            if (std::regex_search(user_agent, match, mac)) {
                return "macOS " + UnderscoresToDots(match[1].str());
            }
            if (std::regex_search(user_agent, match, android)) {
                return "Android " + match[1].str();
            }
            if (std::regex_search(user_agent, match, iphone)) {
                return "iOS " + UnderscoresToDots(match[1].str());
            }
            if (user_agent.find("Linux") != std::string::npos) {
                return "Linux";
            }
            return "Unknown OS";
        }
    }

    DeviceTrustManager::DeviceTrustManager(
        TrustConfig config,
        std::shared_ptr<interfaces::IDeviceTokenStore> token_store,
        std::shared_ptr<interfaces::ISessionStore> session_store,
        std::shared_ptr<interfaces::ITrustCookieJar> cookie_jar,
        std::shared_ptr<const interfaces::IClock> clock)
        : config_(std::move(config))
          , token_store_(std::move(token_store))
          , session_store_(std::move(session_store))
          , cookie_jar_(std::move(cookie_jar))
          , clock_(std::move(clock)) {
    }

    Result<DeviceTrustManager, IdentityFailure> DeviceTrustManager::Create(
        TrustConfig config,
        std::shared_ptr<interfaces::IDeviceTokenStore> token_store,
        std::shared_ptr<interfaces::ISessionStore> session_store,
        std::shared_ptr<interfaces::ITrustCookieJar> cookie_jar,
        std::shared_ptr<const interfaces::IClock> clock) {
        if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
            return Result<DeviceTrustManager, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }
        if (auto config_result = config.Validate(); config_result.IsErr()) {
            return Result<DeviceTrustManager, IdentityFailure>::Err(
                std::move(config_result).UnwrapErr());
        }
        if (!token_store) {
            return Result<DeviceTrustManager, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::MISSING_DEVICE_TOKEN_STORE)));
        }
        if (!session_store) {
            return Result<DeviceTrustManager, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::MISSING_SESSION_STORE)));
        }
        if (!cookie_jar) {
            return Result<DeviceTrustManager, IdentityFailure>::Err(
                IdentityFailure::Configuration(std::string(ErrorMessages::MISSING_COOKIE_JAR)));
        }
        if (!clock) {
            clock = std::make_shared<interfaces::SystemClock>();
        }
        return Result<DeviceTrustManager, IdentityFailure>::Ok(DeviceTrustManager(
            std::move(config),
            std::move(token_store),
            std::move(session_store),
            std::move(cookie_jar),
            std::move(clock)));
    }

    Result<IssuedDeviceToken, IdentityFailure> DeviceTrustManager::Trust(
        const IIdentityRecord& record,
        const TrustContext& context) const {
        const std::string user_id = record.GetAuthIdentifier();

        auto invalidated = session_store_->InvalidateOtherSessions(user_id, context.current_session_id);
        if (invalidated.IsErr()) {
            return Result<IssuedDeviceToken, IdentityFailure>::Err(
                IdentityFailure::Store(std::move(invalidated).UnwrapErr().message));
        }
        KEYWARD_TRACE(Component::DeviceTrust, "Trust", "invalidated {} sessions of {}",
                      invalidated.Unwrap(), user_id);

        const auto now = clock_->Now();
        IssuedDeviceToken issued;
        issued.raw_token = SodiumInterop::ToHex(SodiumInterop::GetRandomBytes(kDeviceTokenBytes));
        issued.record = DeviceToken{
            .token_hash = HashToken(issued.raw_token),
            .user_id = user_id,
            .device_name = ParseDevice(context.user_agent.value_or(std::string())),
            .ip = context.ip.has_value() && !context.ip->empty() ? *context.ip : config_.default_ip,
            .created_at = now,
            .last_used_at = now,
            .expires_at = now + config_.lifetime
        };

        if (auto replaced = token_store_->ReplaceForUser(issued.record); replaced.IsErr()) {
            return Result<IssuedDeviceToken, IdentityFailure>::Err(
                IdentityFailure::Store(std::move(replaced).UnwrapErr().message));
        }

        cookie_jar_->Queue(TrustCookie{
            .name = config_.cookie_name,
            .value = issued.raw_token,
            .max_age = config_.lifetime,
            .secure = context.secure_transport
        });
        return Result<IssuedDeviceToken, IdentityFailure>::Ok(std::move(issued));
    }

    bool DeviceTrustManager::IsTrusted(
        const IIdentityRecord& record,
        const std::optional<std::string>& ip) const {
        const auto raw_token = cookie_jar_->Get(config_.cookie_name);
        if (!raw_token.has_value() || raw_token->empty()) {
            return false;
        }

        const std::string token_hash = HashToken(*raw_token);
        const auto now = clock_->Now();
        const auto token = token_store_->FindValidToken(token_hash, now);
        if (!token.has_value() || token->IsExpiredAt(now)) {
            return false;
        }
        if (token->user_id != record.GetAuthIdentifier()) {
            KEYWARD_TRACE(Component::DeviceTrust, "IsTrusted", "token owned by another account");
            return false;
        }
        if (auto touched = token_store_->TouchLastUsed(token_hash, ip, now); touched.IsErr()) {
            return false;
        }
        return true;
    }

    std::string DeviceTrustManager::ParseDevice(const std::string_view user_agent) {
        if (user_agent.empty()) {
            return std::string(kUnknownDevice);
        }
        const std::string agent(user_agent);
        return compat::format("{} on {}", ParseBrowser(agent), ParseOperatingSystem(agent));
    }

    std::string DeviceTrustManager::HashToken(const std::string_view raw_token) {
        return SodiumInterop::ToHex(SodiumInterop::Sha256(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(raw_token.data()), raw_token.size())));
    }
}
