#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <cstddef>
#include <optional>
#include <string>
namespace keyward::identity::interfaces {
class ISessionStore {
public:
    virtual ~ISessionStore() = default;
    // Deletes every session of the user except keep_session_id. Returns the
    // number removed.
    [[nodiscard]] virtual Result<size_t, IdentityFailure> InvalidateOtherSessions(
        const std::string& user_id,
        const std::optional<std::string>& keep_session_id) = 0;
};
}
