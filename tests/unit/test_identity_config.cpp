#include <catch2/catch_test_macros.hpp>
#include "keyward/configuration/identity_config.hpp"
#include "keyward/crypto/sodium_interop.hpp"
using namespace keyward::identity;
using namespace keyward::identity::configuration;
using namespace std::chrono_literals;
TEST_CASE("IdentityConfig - Defaults", "[config]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto config = IdentityConfig::WithSecret("0123456789abcdef0123456789abcdef");
    SECTION("Documented defaults") {
        REQUIRE(config.enabled);
        REQUIRE(config.mask_unknown_identities);
        REQUIRE(config.nonce.ttl == 300s);
        REQUIRE(config.nonce.max_clock_skew == 0s);
        REQUIRE(config.entropy.min_length == 12);
        REQUIRE(config.entropy.min_unique_chars == 6);
        REQUIRE(config.trust.cookie_name == "device_trust_token");
        REQUIRE(config.trust.lifetime == std::chrono::hours(24 * 90));
        REQUIRE(config.trust.default_ip == "127.0.0.1");
        REQUIRE(config.guard.name == "key");
        REQUIRE(config.guard.driver == GuardDriver::Key);
    }
    SECTION("KDF defaults to the moderate profile") {
        REQUIRE(config.kdf.ops_limit == KdfConfig::Moderate().ops_limit);
        REQUIRE(config.kdf.mem_limit == KdfConfig::Moderate().mem_limit);
    }
    SECTION("Default configuration validates") {
        REQUIRE(config.Validate().IsOk());
    }
}
TEST_CASE("IdentityConfig - KDF profiles", "[config]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Profiles are ordered by cost") {
        REQUIRE(KdfConfig::Minimum().mem_limit < KdfConfig::Interactive().mem_limit);
        REQUIRE(KdfConfig::Interactive().mem_limit < KdfConfig::Moderate().mem_limit);
        REQUIRE(KdfConfig::Moderate().mem_limit < KdfConfig::Sensitive().mem_limit);
    }
    SECTION("Every profile validates") {
        REQUIRE(KdfConfig::Minimum().Validate().IsOk());
        REQUIRE(KdfConfig::Interactive().Validate().IsOk());
        REQUIRE(KdfConfig::Moderate().Validate().IsOk());
        REQUIRE(KdfConfig::Sensitive().Validate().IsOk());
    }
    SECTION("Out of range cost is a configuration error") {
        KdfConfig zero_ops{0, KdfConfig::Minimum().mem_limit};
        auto result = zero_ops.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(IdentityFailureType::Configuration));

        KdfConfig tiny_memory{KdfConfig::Minimum().ops_limit, 1024};
        REQUIRE(tiny_memory.Validate().IsErr());
    }
}
TEST_CASE("IdentityConfig - Validation failures", "[config]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto config = IdentityConfig::WithSecret("0123456789abcdef");
    SECTION("Short nonce secret") {
        config.nonce.secret = "too-short";
        auto result = config.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(IdentityFailureType::Configuration));
    }
    SECTION("Non-positive TTL") {
        config.nonce.ttl = 0s;
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Negative clock skew") {
        config.nonce.max_clock_skew = -1s;
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Empty trust cookie name") {
        config.trust.cookie_name.clear();
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Zero minimum length") {
        config.entropy.min_length = 0;
        REQUIRE(config.Validate().IsErr());
    }
}
