#pragma once
#include <chrono>
#include <optional>
#include <string>
namespace keyward::identity::auth {
struct TrustCookie {
    std::string name;
    std::string value;
    std::chrono::seconds max_age{0};
    std::string path = "/";
    std::optional<std::string> domain;
    bool secure = false;
    bool http_only = true;
    std::string same_site = "Lax";

    // Set-Cookie header value, e.g.
    // "device_trust_token=ab12...; Max-Age=7776000; Path=/; HttpOnly; SameSite=Lax"
    [[nodiscard]] std::string ToHeaderValue() const;
};
}
