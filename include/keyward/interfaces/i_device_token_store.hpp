#pragma once
#include "keyward/models/device_token.hpp"
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <chrono>
#include <optional>
#include <string>
namespace keyward::identity::interfaces {
class IDeviceTokenStore {
public:
    virtual ~IDeviceTokenStore() = default;
    /**
     * @brief Store a token and drop every earlier token of the same user
     *
     * Must be atomic per user: after two concurrent calls exactly one of the
     * two tokens remains.
     */
    [[nodiscard]] virtual Result<Unit, IdentityFailure> ReplaceForUser(
        const models::DeviceToken& token) = 0;
    // Unexpired token with this hash, if any.
    [[nodiscard]] virtual std::optional<models::DeviceToken> FindValidToken(
        const std::string& token_hash,
        std::chrono::system_clock::time_point now) = 0;
    [[nodiscard]] virtual Result<Unit, IdentityFailure> TouchLastUsed(
        const std::string& token_hash,
        const std::optional<std::string>& ip,
        std::chrono::system_clock::time_point now) = 0;
};
}
