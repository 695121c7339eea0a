#include "keyward/crypto/sodium_interop.hpp"

#include <cstring>

namespace keyward::identity::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > kMaxSecureBufferBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(kMaxSecureBufferBytes)));
    }

    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& text) {
    auto result = SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(text.data()),
        text.size()));
    text.clear();
    return result;
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) +
                ": " + std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::string_view a,
    std::string_view b) {
    return ConstantTimeEquals(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(a.data()), a.size()),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(b.data()), b.size()));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

// ============================================================================
// Hashing
// ============================================================================

std::vector<uint8_t> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::vector<uint8_t> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    crypto_auth_hmacsha256_state state;
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

// ============================================================================
// Encodings
// ============================================================================

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

std::optional<std::vector<uint8_t>> SodiumInterop::FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> bin(hex.size() / 2);
    size_t bin_len = 0;
    const char* hex_end = nullptr;
    if (sodium_hex2bin(bin.data(), bin.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &hex_end) != 0 ||
        hex_end != hex.data() + hex.size()) {
        return std::nullopt;
    }
    bin.resize(bin_len);
    return bin;
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(std::strlen(encoded.c_str()));
    return encoded;
}

std::optional<std::vector<uint8_t>> SodiumInterop::FromBase64(std::string_view encoded) {
    if (encoded.empty()) {
        return std::nullopt;
    }
    std::vector<uint8_t> bin(encoded.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* b64_end = nullptr;
    if (sodium_base642bin(bin.data(), bin.size(), encoded.data(), encoded.size(),
                          nullptr, &bin_len, &b64_end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        b64_end != encoded.data() + encoded.size()) {
        return std::nullopt;
    }
    bin.resize(bin_len);
    return bin;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace keyward::identity::crypto
