#pragma once
#include "keyward/interfaces/i_identity_record.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
namespace keyward::identity::auth {
struct Credentials {
    std::string email;
    std::string passphrase;
};

enum class GuardState : uint8_t {
    Anonymous = 0,
    Pending = 1,
    Authenticated = 2,
    Rejected = 3
};

// Closed capability set shared by every guard. Guards are built by
// IdentityModule from a GuardConfig; one guard instance serves one request.
class IGuard {
public:
    virtual ~IGuard() = default;
    [[nodiscard]] virtual bool Check() const = 0;
    [[nodiscard]] virtual bool Guest() const = 0;
    [[nodiscard]] virtual std::shared_ptr<interfaces::IIdentityRecord> User() const = 0;
    [[nodiscard]] virtual std::optional<std::string> Id() const = 0;
    // Checks credentials without touching guard state.
    [[nodiscard]] virtual bool Validate(const Credentials& credentials) const = 0;
    virtual bool Attempt(const Credentials& credentials) = 0;
    virtual void Login(std::shared_ptr<interfaces::IIdentityRecord> record) = 0;
    virtual void Logout() = 0;
    virtual void SetUser(std::shared_ptr<interfaces::IIdentityRecord> record) = 0;
    [[nodiscard]] virtual const std::string& Name() const noexcept = 0;
    [[nodiscard]] virtual GuardState State() const noexcept = 0;
};
}
