#pragma once
#include <string>
#include <string_view>
#include <vector>
namespace keyward::identity {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class IdentityFailureType {
    Generic,
    Configuration,
    WeakPassphrase,
    InvalidInput,
    AlreadyRegistered,
    KeyDerivation,
    Store,
    ReplayDetected
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class IdentityFailure {
public:
    IdentityFailureType type;
    std::string message;
    // Human-readable, user-facing reasons. Populated for WeakPassphrase only.
    std::vector<std::string> reasons;
    IdentityFailure(const IdentityFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    IdentityFailure(const IdentityFailureType t, std::string msg, std::vector<std::string> why)
        : type(t), message(std::move(msg)), reasons(std::move(why)) {}
    static IdentityFailure Generic(std::string msg) {
        return {IdentityFailureType::Generic, std::move(msg)};
    }
    static IdentityFailure Configuration(std::string msg) {
        return {IdentityFailureType::Configuration, std::move(msg)};
    }
    static IdentityFailure WeakPassphrase(std::vector<std::string> reasons) {
        return {IdentityFailureType::WeakPassphrase,
                "Passphrase does not meet entropy requirements",
                std::move(reasons)};
    }
    static IdentityFailure InvalidInput(std::string msg) {
        return {IdentityFailureType::InvalidInput, std::move(msg)};
    }
    static IdentityFailure AlreadyRegistered(std::string msg) {
        return {IdentityFailureType::AlreadyRegistered, std::move(msg)};
    }
    static IdentityFailure KeyDerivation(std::string msg) {
        return {IdentityFailureType::KeyDerivation, std::move(msg)};
    }
    static IdentityFailure Store(std::string msg) {
        return {IdentityFailureType::Store, std::move(msg)};
    }
    static IdentityFailure ReplayDetected(std::string msg) {
        return {IdentityFailureType::ReplayDetected, std::move(msg)};
    }
    static IdentityFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return Configuration(sf.message);
        }
        return KeyDerivation(sf.message);
    }
    [[nodiscard]] bool Is(const IdentityFailureType t) const noexcept {
        return type == t;
    }
};
}
