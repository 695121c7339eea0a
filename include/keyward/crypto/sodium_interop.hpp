#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::identity::crypto {

/**
 * @brief Interop layer for libsodium primitives used by the identity core
 *
 * Wraps initialization, secure wiping, constant-time comparison, randomness,
 * hashing and the text encodings (hex, base64) that travel over the wire.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every service factory calls this first and
     * refuses to construct when it fails.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Overwrite a buffer with zero bytes
     *
     * Small buffers go through a volatile loop, large ones through
     * sodium_memzero. Neither can be elided by the optimizer.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Wipe the character storage of a string holding secret text
     *
     * Clears the string afterwards. Only the live buffer is wiped, so callers
     * must reserve up front instead of growing secret strings.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::string_view a,
        std::string_view b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Hashing
    // ========================================================================

    static std::vector<uint8_t> Sha256(std::span<const uint8_t> data);

    /**
     * @brief HMAC-SHA256 with a key of arbitrary length
     */
    static std::vector<uint8_t> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    // ========================================================================
    // Encodings
    // ========================================================================

    /// Lowercase hex.
    static std::string ToHex(std::span<const uint8_t> data);

    static std::optional<std::vector<uint8_t>> FromHex(std::string_view hex);

    /// Standard alphabet, padded.
    static std::string ToBase64(std::span<const uint8_t> data);

    static std::optional<std::vector<uint8_t>> FromBase64(std::string_view encoded);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, mlocked memory via sodium_malloc
     *
     * @return nullptr when libsodium is not initialized or allocation fails
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace keyward::identity::crypto
