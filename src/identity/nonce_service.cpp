#include "keyward/identity/nonce_service.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/debug/auth_trace.hpp"

#include <algorithm>
#include <charconv>

namespace keyward::identity {
    using crypto::SodiumInterop;
    using crypto::SecureMemoryHandle;
    using configuration::NonceConfig;
    using debug::Component;

    namespace {
        bool IsLowerHex(const std::string_view text) {
            return std::all_of(text.begin(), text.end(), [](const char c) {
                return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            });
        }

        bool IsAsciiDigits(const std::string_view text) {
            return !text.empty() && std::all_of(text.begin(), text.end(), [](const char c) {
                return c >= '0' && c <= '9';
            });
        }

        std::span<const uint8_t> AsBytes(const std::string_view text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }
    }

    NonceService::NonceService(
        SecureMemoryHandle secret,
        const std::chrono::seconds ttl,
        const std::chrono::seconds max_clock_skew,
        std::shared_ptr<const interfaces::IClock> clock) noexcept
        : secret_(std::move(secret))
          , ttl_(ttl)
          , max_clock_skew_(max_clock_skew)
          , clock_(std::move(clock)) {
    }

    Result<NonceService, IdentityFailure> NonceService::Create(
        const NonceConfig& config,
        std::shared_ptr<const interfaces::IClock> clock) {
        if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
            return Result<NonceService, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }
        if (auto config_result = config.Validate(); config_result.IsErr()) {
            return Result<NonceService, IdentityFailure>::Err(
                std::move(config_result).UnwrapErr());
        }

        auto secret_alloc = SecureMemoryHandle::Allocate(config.secret.size());
        if (secret_alloc.IsErr()) {
            return Result<NonceService, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(secret_alloc.UnwrapErr()));
        }
        SecureMemoryHandle secret = std::move(secret_alloc).Unwrap();
        if (auto write_result = secret.Write(AsBytes(config.secret)); write_result.IsErr()) {
            return Result<NonceService, IdentityFailure>::Err(
                IdentityFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }

        if (!clock) {
            clock = std::make_shared<interfaces::SystemClock>();
        }
        KEYWARD_TRACE(Component::Nonce, "Create", "ttl={}s skew={}s",
                      config.ttl.count(), config.max_clock_skew.count());
        return Result<NonceService, IdentityFailure>::Ok(
            NonceService(std::move(secret), config.ttl, config.max_clock_skew, std::move(clock)));
    }

    std::string NonceService::Generate(const std::string_view identifier) const {
        const auto random = SodiumInterop::GetRandomBytes(kNonceRandomBytes);
        const std::string payload = compat::format(
            "{}{}{}", SodiumInterop::ToHex(random), kNonceSeparator, UnixNow());
        // Only fails on a moved-from service.
        const auto mac = ComputeMac(identifier, payload).Unwrap();
        return compat::format("{}{}{}", payload, kNonceSeparator, SodiumInterop::ToHex(mac));
    }

    bool NonceService::Validate(const std::string_view identifier, const std::string_view nonce) const {
        const auto parsed = Parse(nonce);
        if (!parsed.has_value()) {
            KEYWARD_TRACE(Component::Nonce, "Validate", "rejected: malformed");
            return false;
        }

        const int64_t now = UnixNow();
        const int64_t issued_at = parsed->timestamp;
        if (now > issued_at &&
            static_cast<uint64_t>(now) - static_cast<uint64_t>(issued_at) >
            static_cast<uint64_t>(ttl_.count())) {
            KEYWARD_TRACE(Component::Nonce, "Validate", "rejected: expired");
            return false;
        }
        if (issued_at > now &&
            static_cast<uint64_t>(issued_at) - static_cast<uint64_t>(now) >
            static_cast<uint64_t>(max_clock_skew_.count())) {
            KEYWARD_TRACE(Component::Nonce, "Validate", "rejected: issued in the future");
            return false;
        }

        const std::string payload = compat::format(
            "{}{}{}", parsed->random, kNonceSeparator, issued_at);
        auto expected = ComputeMac(identifier, payload);
        if (expected.IsErr()) {
            return false;
        }
        const std::string expected_hex = SodiumInterop::ToHex(expected.Unwrap());
        auto equal = SodiumInterop::ConstantTimeEquals(
            std::string_view(expected_hex), parsed->mac);
        if (equal.IsErr() || !equal.Unwrap()) {
            KEYWARD_TRACE(Component::Nonce, "Validate", "rejected: mac mismatch");
            return false;
        }
        return true;
    }

    std::optional<NonceService::ParsedNonce> NonceService::Parse(const std::string_view nonce) {
        const size_t first = nonce.find(kNonceSeparator);
        if (first == std::string_view::npos) {
            return std::nullopt;
        }
        const size_t second = nonce.find(kNonceSeparator, first + 1);
        if (second == std::string_view::npos ||
            nonce.find(kNonceSeparator, second + 1) != std::string_view::npos) {
            return std::nullopt;
        }

        ParsedNonce parsed;
        parsed.random = nonce.substr(0, first);
        const std::string_view timestamp = nonce.substr(first + 1, second - first - 1);
        parsed.mac = nonce.substr(second + 1);

        if (parsed.random.size() != kNonceRandomHexChars || !IsLowerHex(parsed.random)) {
            return std::nullopt;
        }
        if (!IsAsciiDigits(timestamp)) {
            return std::nullopt;
        }
        if (parsed.mac.size() != kNonceHmacHexChars) {
            return std::nullopt;
        }
        const auto [end, ec] = std::from_chars(
            timestamp.data(), timestamp.data() + timestamp.size(), parsed.timestamp);
        if (ec != std::errc() || end != timestamp.data() + timestamp.size()) {
            return std::nullopt;
        }
        return parsed;
    }

    Result<std::vector<uint8_t>, SodiumFailure> NonceService::ComputeMac(
        const std::string_view identifier,
        const std::string_view payload) const {
        std::string message;
        message.reserve(identifier.size() + 1 + payload.size());
        message.append(identifier);
        message.push_back(kNonceIdentifierSeparator);
        message.append(payload);
        return secret_.WithReadAccess([&](std::span<const uint8_t> key) {
            return SodiumInterop::HmacSha256(key, AsBytes(message));
        });
    }

    int64_t NonceService::UnixNow() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            clock_->Now().time_since_epoch()).count();
    }
}
