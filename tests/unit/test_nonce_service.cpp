#include <catch2/catch_test_macros.hpp>
#include "keyward/identity/nonce_service.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "../helpers/fixed_clock.hpp"
#include <string>
#include <unordered_set>
#include <cctype>
#include <vector>
using namespace keyward::identity;
using namespace keyward::identity::configuration;
using namespace keyward::identity::test_helpers;
using namespace std::chrono_literals;
namespace {
NonceConfig MakeNonceConfig() {
    NonceConfig config;
    config.secret = "nonce-test-secret-0123456789abcdef";
    return config;
}
std::vector<std::string> Split(const std::string& nonce) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t pos = nonce.find('.'); pos != std::string::npos; pos = nonce.find('.', start)) {
        parts.push_back(nonce.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(nonce.substr(start));
    return parts;
}
}
TEST_CASE("NonceService - Construction", "[nonce]") {
    SECTION("Valid configuration") {
        auto service = NonceService::Create(MakeNonceConfig());
        REQUIRE(service.IsOk());
        REQUIRE(service.Unwrap().Ttl() == 300s);
        REQUIRE(service.Unwrap().MaxClockSkew() == 0s);
    }
    SECTION("Short secret is rejected") {
        NonceConfig config = MakeNonceConfig();
        config.secret = "short";
        auto service = NonceService::Create(config);
        REQUIRE(service.IsErr());
        REQUIRE(service.UnwrapErr().Is(IdentityFailureType::Configuration));
    }
    SECTION("Non-positive TTL is rejected") {
        NonceConfig config = MakeNonceConfig();
        config.ttl = 0s;
        REQUIRE(NonceService::Create(config).IsErr());
    }
    SECTION("Secrets of arbitrary length are accepted") {
        NonceConfig config = MakeNonceConfig();
        config.secret = std::string(300, 's');
        REQUIRE(NonceService::Create(config).IsOk());
    }
}
TEST_CASE("NonceService - Wire format", "[nonce]") {
    auto clock = std::make_shared<FixedClock>(1'700'000'000);
    auto service = NonceService::Create(MakeNonceConfig(), clock).Unwrap();
    const std::string nonce = service.Generate("alice@example.com");
    const auto parts = Split(nonce);
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[0].size() == 32);
    REQUIRE(parts[1] == "1700000000");
    REQUIRE(parts[2].size() == 64);
    REQUIRE(keyward::identity::crypto::SodiumInterop::FromHex(parts[0]).has_value());
    REQUIRE(keyward::identity::crypto::SodiumInterop::FromHex(parts[2]).has_value());

    SECTION("Fresh nonces differ") {
        std::unordered_set<std::string> seen;
        for (int i = 0; i < 100; ++i) {
            seen.insert(service.Generate("alice@example.com"));
        }
        REQUIRE(seen.size() == 100);
    }
}
TEST_CASE("NonceService - Expiry boundaries", "[nonce]") {
    auto clock = std::make_shared<FixedClock>(1'700'000'000);
    auto service = NonceService::Create(MakeNonceConfig(), clock).Unwrap();
    const std::string nonce = service.Generate("alice@example.com");

    SECTION("Accepted when issued") {
        REQUIRE(service.Validate("alice@example.com", nonce));
    }
    SECTION("Accepted at TTL - 1") {
        clock->Advance(299s);
        REQUIRE(service.Validate("alice@example.com", nonce));
    }
    SECTION("Accepted at exactly TTL") {
        clock->Advance(300s);
        REQUIRE(service.Validate("alice@example.com", nonce));
    }
    SECTION("Rejected at TTL + 1") {
        clock->Advance(301s);
        REQUIRE_FALSE(service.Validate("alice@example.com", nonce));
    }
    SECTION("Validation does not consume the nonce") {
        REQUIRE(service.Validate("alice@example.com", nonce));
        REQUIRE(service.Validate("alice@example.com", nonce));
    }
}
TEST_CASE("NonceService - Future timestamps", "[nonce]") {
    auto clock = std::make_shared<FixedClock>(1'700'000'000);
    SECTION("Rejected without skew allowance") {
        auto service = NonceService::Create(MakeNonceConfig(), clock).Unwrap();
        const std::string nonce = service.Generate("alice@example.com");
        clock->Advance(-1s);
        REQUIRE_FALSE(service.Validate("alice@example.com", nonce));
    }
    SECTION("Accepted within configured skew") {
        NonceConfig config = MakeNonceConfig();
        config.max_clock_skew = 5s;
        auto service = NonceService::Create(config, clock).Unwrap();
        const std::string nonce = service.Generate("alice@example.com");
        clock->Advance(-5s);
        REQUIRE(service.Validate("alice@example.com", nonce));
        clock->Advance(-1s);
        REQUIRE_FALSE(service.Validate("alice@example.com", nonce));
    }
}
TEST_CASE("NonceService - Binding and integrity", "[nonce][security]") {
    auto clock = std::make_shared<FixedClock>(1'700'000'000);
    auto service = NonceService::Create(MakeNonceConfig(), clock).Unwrap();
    const std::string nonce = service.Generate("alice@example.com");
    const auto parts = Split(nonce);

    SECTION("Bound to its identifier") {
        REQUIRE_FALSE(service.Validate("bob@example.com", nonce));
    }
    SECTION("Different secret rejects") {
        NonceConfig other_config = MakeNonceConfig();
        other_config.secret = "a-completely-different-secret-value";
        auto other = NonceService::Create(other_config, clock).Unwrap();
        REQUIRE_FALSE(other.Validate("alice@example.com", nonce));
    }
    SECTION("Tampered timestamp rejects") {
        const std::string tampered = parts[0] + ".1700000001." + parts[2];
        REQUIRE_FALSE(service.Validate("alice@example.com", tampered));
    }
    SECTION("Leading zeros in the timestamp reject") {
        const std::string tampered = parts[0] + ".01700000000." + parts[2];
        REQUIRE_FALSE(service.Validate("alice@example.com", tampered));
    }
    SECTION("Tampered random part rejects") {
        std::string random = parts[0];
        random[0] = random[0] == 'a' ? 'b' : 'a';
        REQUIRE_FALSE(service.Validate("alice@example.com", random + "." + parts[1] + "." + parts[2]));
    }
    SECTION("Truncated MAC rejects") {
        REQUIRE_FALSE(service.Validate("alice@example.com", parts[0] + "." + parts[1] + "." + parts[2].substr(0, 63)));
    }
}
TEST_CASE("NonceService - Malformed input", "[nonce][security]") {
    auto clock = std::make_shared<FixedClock>(1'700'000'000);
    auto service = NonceService::Create(MakeNonceConfig(), clock).Unwrap();
    const std::string nonce = service.Generate("alice@example.com");
    const auto parts = Split(nonce);
    SECTION("Wrong part count") {
        REQUIRE_FALSE(service.Validate("alice@example.com", ""));
        REQUIRE_FALSE(service.Validate("alice@example.com", parts[0] + "." + parts[1]));
        REQUIRE_FALSE(service.Validate("alice@example.com", nonce + ".extra"));
    }
    SECTION("Non-numeric timestamp") {
        REQUIRE_FALSE(service.Validate("alice@example.com", parts[0] + ".17e8." + parts[2]));
        REQUIRE_FALSE(service.Validate("alice@example.com", parts[0] + ".-5." + parts[2]));
        REQUIRE_FALSE(service.Validate("alice@example.com", parts[0] + ".." + parts[2]));
    }
    SECTION("Timestamp overflowing 64 bits") {
        REQUIRE_FALSE(service.Validate("alice@example.com", parts[0] + ".99999999999999999999999." + parts[2]));
    }
    SECTION("Uppercase or short random part") {
        std::string upper = parts[0];
        for (auto& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (upper != parts[0]) {
            REQUIRE_FALSE(service.Validate("alice@example.com", upper + "." + parts[1] + "." + parts[2]));
        }
        REQUIRE_FALSE(service.Validate("alice@example.com", parts[0].substr(1) + "." + parts[1] + "." + parts[2]));
    }
}
