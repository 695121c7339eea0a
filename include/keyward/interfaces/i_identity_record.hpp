#pragma once
#include <string>
#include <vector>
namespace keyward::identity::interfaces {
// A persisted identity as seen by the core. Owned by the application's store.
class IIdentityRecord {
public:
    virtual ~IIdentityRecord() = default;
    [[nodiscard]] virtual std::string GetAuthIdentifier() const = 0;
    // Normalized (trimmed, lowercase).
    [[nodiscard]] virtual std::string GetEmail() const = 0;
    // Base64 of the 32-byte Ed25519 public key; empty when none is set.
    [[nodiscard]] virtual std::string GetPublicKey() const = 0;
    virtual void SetPublicKey(const std::string& public_key) = 0;
    [[nodiscard]] virtual std::vector<std::string> GetPromptIds() const = 0;
    virtual void SetPromptIds(const std::vector<std::string>& prompt_ids) = 0;
};
}
