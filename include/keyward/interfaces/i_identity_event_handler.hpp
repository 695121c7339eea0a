#pragma once
#include "keyward/interfaces/i_identity_record.hpp"
#include <string>
namespace keyward::identity::interfaces {
// Lifecycle notifications. Payloads never contain a passphrase or private key.
class IIdentityEventHandler {
public:
    virtual ~IIdentityEventHandler() = default;
    virtual void OnIdentityRegistered(const IIdentityRecord& record, const std::string& public_key) = 0;
    virtual void OnIdentityRecovered(const IIdentityRecord& record, const std::string& public_key) = 0;
    virtual void OnAuthAttempting(const std::string& guard, const std::string& email) = 0;
    virtual void OnAuthSucceeded(const std::string& guard, const IIdentityRecord& record) = 0;
    virtual void OnAuthFailed(const std::string& guard, const std::string& email) = 0;
};
}
