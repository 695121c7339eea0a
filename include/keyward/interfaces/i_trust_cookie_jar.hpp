#pragma once
#include "keyward/auth/trust_cookie.hpp"
#include <optional>
#include <string>
namespace keyward::identity::interfaces {
// Request cookies in, response cookies out.
class ITrustCookieJar {
public:
    virtual ~ITrustCookieJar() = default;
    [[nodiscard]] virtual std::optional<std::string> Get(const std::string& name) const = 0;
    virtual void Queue(const auth::TrustCookie& cookie) = 0;
};
}
