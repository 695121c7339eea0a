#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace keyward::identity {

inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SeedBytes = 32;
inline constexpr size_t kEd25519SignatureBytes = 64;

// Must equal crypto_pwhash_SALTBYTES.
inline constexpr size_t kKdfSaltBytes = 16;

inline constexpr size_t kNonceRandomBytes = 16;
inline constexpr size_t kNonceRandomHexChars = kNonceRandomBytes * 2;
inline constexpr size_t kNonceHmacBytes = 32;
inline constexpr size_t kNonceHmacHexChars = kNonceHmacBytes * 2;
inline constexpr char kNonceSeparator = '.';
inline constexpr char kNonceIdentifierSeparator = '|';
inline constexpr size_t kMinNonceSecretBytes = 16;
inline constexpr std::chrono::seconds kDefaultNonceTtl{300};

inline constexpr size_t kDeviceTokenBytes = 32;
inline constexpr std::chrono::hours kDefaultTrustLifetime{24 * 90};
inline constexpr std::string_view kDefaultTrustCookieName = "device_trust_token";
inline constexpr std::string_view kDefaultClientIp = "127.0.0.1";
inline constexpr std::string_view kUnknownDevice = "Unknown Device";

inline constexpr size_t kDefaultMinPassphraseLength = 12;
inline constexpr size_t kDefaultMinUniqueChars = 6;

inline constexpr size_t kMaxSecureBufferBytes = 1'000'000'000;

// Stands in for a missing identity so the unknown-email path runs a full KDF.
inline constexpr std::string_view kUnknownIdentityPlaceholder = "unknown-identity@keyward.invalid";

inline constexpr std::string_view kDefaultGuardName = "key";

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view KDF_OUT_OF_MEMORY = "Argon2id derivation failed (out of memory)";
    static constexpr std::string_view SEED_KEYPAIR_FAILED = "Failed to expand seed into Ed25519 keypair";
    static constexpr std::string_view SIGN_FAILED = "Ed25519 detached signing failed";
    static constexpr std::string_view MISSING_IDENTITY_STORE = "Identity store binding is missing";
    static constexpr std::string_view MISSING_DEVICE_TOKEN_STORE = "Device token store binding is missing";
    static constexpr std::string_view MISSING_SESSION_STORE = "Session store binding is missing";
    static constexpr std::string_view MISSING_COOKIE_JAR = "Trust cookie jar binding is missing";
    static constexpr std::string_view NONCE_SECRET_TOO_SHORT = "Nonce secret must be at least 16 bytes";
    static constexpr std::string_view NONCE_TTL_NOT_POSITIVE = "Nonce TTL must be positive";
    static constexpr std::string_view REPLAY_LEDGER_TOO_SHORT =
        "Replay ledger lifetime is shorter than the nonce TTL plus clock skew";
    static constexpr std::string_view NONCE_ALREADY_USED = "Nonce has already been consumed";
    static constexpr std::string_view EMAIL_REQUIRED = "Email is required";
    static constexpr std::string_view IDENTITY_EXISTS = "An identity is already registered for this email";
};

}
