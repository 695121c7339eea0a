#include <catch2/catch_test_macros.hpp>
#include "keyward/auth/key_guard.hpp"
#include "keyward/security/nonce_replay_ledger.hpp"
#include "../helpers/identity_fixture.hpp"
#include <memory>
#include <string>

using namespace keyward::identity;
using namespace keyward::identity::auth;
using namespace keyward::identity::test_helpers;

namespace {
constexpr const char* kAlice = "alice@example.com";
constexpr const char* kBob = "bob@example.com";
constexpr const char* kPassphrase = "correct horse battery staple 9!";

std::unique_ptr<KeyGuard> MakeGuard(const IdentityFixture& fixture,
                                    std::shared_ptr<security::NonceReplayLedger> ledger) {
    return KeyGuard::Create("web", KeyGuardDependencies{
        .key_service = fixture.key_service,
        .nonce_service = fixture.nonce_service,
        .store = fixture.store,
        .event_handler = fixture.events,
        .replay_ledger = std::move(ledger)}).Unwrap();
}

std::string Sign(const IdentityFixture& fixture, const std::string& email,
                 const std::string& passphrase, const std::string& nonce) {
    auto key_pair = fixture.key_service->DeriveKeyPair(email, passphrase).Unwrap();
    auto signature = fixture.key_service->SignChallenge(key_pair, nonce).Unwrap();
    key_pair.Wipe();
    return signature;
}
}

TEST_CASE("Replay Attacks - Captured signed nonce", "[attacks][replay][critical]") {
    IdentityFixture fixture;
    auto manager = fixture.MakeManager();
    REQUIRE(manager.Register(kAlice, kPassphrase).IsOk());
    auto ledger = std::make_shared<security::NonceReplayLedger>(
        fixture.nonce_service->Ttl(), fixture.nonce_service->Ttl(), fixture.clock);

    SECTION("Replaying a used signature and nonce must fail") {
        auto victim = MakeGuard(fixture, ledger);
        const std::string nonce = victim->Challenge(kAlice);
        const std::string signature = Sign(fixture, kAlice, kPassphrase, nonce);
        REQUIRE(victim->AuthenticateWithSignature(kAlice, signature, nonce));

        for (int i = 0; i < 10; ++i) {
            auto attacker = MakeGuard(fixture, ledger);
            REQUIRE_FALSE(attacker->AuthenticateWithSignature(kAlice, signature, nonce));
        }
    }

    SECTION("Replay after the window closes fails on expiry") {
        auto victim = MakeGuard(fixture, ledger);
        const std::string nonce = victim->Challenge(kAlice);
        const std::string signature = Sign(fixture, kAlice, kPassphrase, nonce);
        REQUIRE(victim->AuthenticateWithSignature(kAlice, signature, nonce));

        fixture.clock->Advance(fixture.nonce_service->Ttl() + std::chrono::seconds(1));
        ledger->CleanupExpiredNonces();
        auto attacker = MakeGuard(fixture, ledger);
        REQUIRE_FALSE(attacker->AuthenticateWithSignature(kAlice, signature, nonce));
    }

    SECTION("Consumed nonce stays blocked until it expires despite pruning") {
        auto eager_ledger = std::make_shared<security::NonceReplayLedger>(
            fixture.nonce_service->Ttl(), std::chrono::seconds(1), fixture.clock);
        auto victim = MakeGuard(fixture, eager_ledger);
        const std::string nonce = victim->Challenge(kAlice);
        fixture.clock->Advance(std::chrono::seconds(10));
        const std::string signature = Sign(fixture, kAlice, kPassphrase, nonce);
        REQUIRE(victim->AuthenticateWithSignature(kAlice, signature, nonce));

        // Another login late in the window runs a cleanup pass.
        fixture.clock->Advance(fixture.nonce_service->Ttl() - std::chrono::seconds(20));
        auto other = MakeGuard(fixture, eager_ledger);
        const std::string fresh = other->Challenge(kAlice);
        REQUIRE(other->AuthenticateWithSignature(kAlice, Sign(fixture, kAlice, kPassphrase, fresh), fresh));

        fixture.clock->Advance(std::chrono::seconds(5));
        auto attacker = MakeGuard(fixture, eager_ledger);
        REQUIRE(fixture.nonce_service->Validate(kAlice, nonce));
        REQUIRE_FALSE(attacker->AuthenticateWithSignature(kAlice, signature, nonce));
        REQUIRE(eager_ledger->TrackedCount() == 2);
    }

    SECTION("Nonce issued for one identity cannot serve another") {
        REQUIRE(manager.Register(kBob, "a different strong passphrase").IsOk());
        auto guard = MakeGuard(fixture, ledger);
        const std::string bob_nonce = guard->Challenge(kBob);
        const std::string signature = Sign(fixture, kAlice, kPassphrase, bob_nonce);
        REQUIRE_FALSE(guard->AuthenticateWithSignature(kAlice, signature, bob_nonce));
    }

    SECTION("Fresh nonces keep working after a replay attempt") {
        auto guard = MakeGuard(fixture, ledger);
        const std::string first = guard->Challenge(kAlice);
        const std::string first_signature = Sign(fixture, kAlice, kPassphrase, first);
        REQUIRE(guard->AuthenticateWithSignature(kAlice, first_signature, first));
        REQUIRE_FALSE(guard->AuthenticateWithSignature(kAlice, first_signature, first));

        fixture.clock->Advance(std::chrono::seconds(1));
        const std::string second = guard->Challenge(kAlice);
        REQUIRE(second != first);
        REQUIRE(guard->AuthenticateWithSignature(kAlice, Sign(fixture, kAlice, kPassphrase, second), second));
    }
}
