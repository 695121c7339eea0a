#pragma once
#include "keyward/interfaces/i_identity_record.hpp"
#include "keyward/models/identity_fields.hpp"
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <memory>
#include <string>
namespace keyward::identity::interfaces {
class IIdentityStore {
public:
    virtual ~IIdentityStore() = default;
    // Lookup by normalized email. nullptr when absent.
    [[nodiscard]] virtual std::shared_ptr<IIdentityRecord> FindByIdentifier(
        const std::string& email) = 0;
    [[nodiscard]] virtual Result<std::shared_ptr<IIdentityRecord>, IdentityFailure> Create(
        const models::IdentityFields& fields) = 0;
    [[nodiscard]] virtual Result<Unit, IdentityFailure> Save(IIdentityRecord& record) = 0;
};
}
