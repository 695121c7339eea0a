#include "keyward/auth/trust_cookie.hpp"
#include "keyward/core/format.hpp"

namespace keyward::identity::auth {
    std::string TrustCookie::ToHeaderValue() const {
        std::string header = compat::format("{}={}; Max-Age={}; Path={}",
                                            name, value, max_age.count(), path);
        if (domain.has_value()) {
            header += compat::format("; Domain={}", *domain);
        }
        if (http_only) {
            header += "; HttpOnly";
        }
        if (!same_site.empty()) {
            header += compat::format("; SameSite={}", same_site);
        }
        if (secure) {
            header += "; Secure";
        }
        return header;
    }
}
