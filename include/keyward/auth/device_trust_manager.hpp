#pragma once

#include "keyward/auth/trust_cookie.hpp"
#include "keyward/configuration/identity_config.hpp"
#include "keyward/interfaces/i_clock.hpp"
#include "keyward/interfaces/i_device_token_store.hpp"
#include "keyward/interfaces/i_identity_record.hpp"
#include "keyward/interfaces/i_session_store.hpp"
#include "keyward/interfaces/i_trust_cookie_jar.hpp"
#include "keyward/models/device_token.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace keyward::identity::auth {

struct TrustContext {
    std::optional<std::string> user_agent;
    std::optional<std::string> ip;
    // Session that survives the invalidation of the account's other sessions.
    std::optional<std::string> current_session_id;
    bool secure_transport = false;
};

/**
 * @brief One trusted device per account
 *
 * Trusting a device invalidates the account's other sessions and supersedes
 * every earlier device token. The raw token travels only in the trust cookie;
 * stores see its SHA-256.
 */
class DeviceTrustManager {
public:
    [[nodiscard]] static Result<DeviceTrustManager, IdentityFailure> Create(
        configuration::TrustConfig config,
        std::shared_ptr<interfaces::IDeviceTokenStore> token_store,
        std::shared_ptr<interfaces::ISessionStore> session_store,
        std::shared_ptr<interfaces::ITrustCookieJar> cookie_jar,
        std::shared_ptr<const interfaces::IClock> clock = nullptr);

    [[nodiscard]] Result<models::IssuedDeviceToken, IdentityFailure> Trust(
        const interfaces::IIdentityRecord& record,
        const TrustContext& context) const;

    /**
     * @brief Whether the request's trust cookie names a live token of this user
     *
     * Refreshes last-used time and ip on success. Fails closed.
     */
    [[nodiscard]] bool IsTrusted(
        const interfaces::IIdentityRecord& record,
        const std::optional<std::string>& ip = std::nullopt) const;

    /// "<Browser> on <OS>", or "Unknown Device" for an empty user agent.
    [[nodiscard]] static std::string ParseDevice(std::string_view user_agent);

    /// Lowercase hex SHA-256 of the raw token.
    [[nodiscard]] static std::string HashToken(std::string_view raw_token);

    [[nodiscard]] const configuration::TrustConfig& Config() const noexcept {
        return config_;
    }

private:
    DeviceTrustManager(
        configuration::TrustConfig config,
        std::shared_ptr<interfaces::IDeviceTokenStore> token_store,
        std::shared_ptr<interfaces::ISessionStore> session_store,
        std::shared_ptr<interfaces::ITrustCookieJar> cookie_jar,
        std::shared_ptr<const interfaces::IClock> clock);

    configuration::TrustConfig config_;
    std::shared_ptr<interfaces::IDeviceTokenStore> token_store_;
    std::shared_ptr<interfaces::ISessionStore> session_store_;
    std::shared_ptr<interfaces::ITrustCookieJar> cookie_jar_;
    std::shared_ptr<const interfaces::IClock> clock_;
};

} // namespace keyward::identity::auth
