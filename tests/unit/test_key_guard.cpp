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
constexpr const char* kAlicePassphrase = "correct horse battery staple 9!";

struct GuardFixture : IdentityFixture {
    std::shared_ptr<security::NonceReplayLedger> ledger;

    std::unique_ptr<KeyGuard> MakeGuard(const bool with_ledger = false, std::string name = "web") {
        if (with_ledger && !ledger) {
            ledger = std::make_shared<security::NonceReplayLedger>(
                nonce_service->Ttl(), nonce_service->Ttl(), clock);
        }
        KeyGuardDependencies deps{
            .key_service = key_service,
            .nonce_service = nonce_service,
            .store = store,
            .event_handler = events,
            .replay_ledger = with_ledger ? ledger : nullptr
        };
        return KeyGuard::Create(std::move(name), std::move(deps)).Unwrap();
    }

    std::string SignAs(const std::string& email, const std::string& passphrase, const std::string& nonce) const {
        auto key_pair = key_service->DeriveKeyPair(email, passphrase).Unwrap();
        auto signature = key_service->SignChallenge(key_pair, nonce).Unwrap();
        key_pair.Wipe();
        return signature;
    }
};
}
TEST_CASE("KeyGuard - Construction", "[guard]") {
    GuardFixture fixture;
    SECTION("Missing store is a configuration error") {
        auto result = KeyGuard::Create("web", KeyGuardDependencies{
            .key_service = fixture.key_service,
            .nonce_service = fixture.nonce_service});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(IdentityFailureType::Configuration));
    }
    SECTION("Replay ledger shorter than the nonce TTL is a configuration error") {
        auto result = KeyGuard::Create("web", KeyGuardDependencies{
            .key_service = fixture.key_service,
            .nonce_service = fixture.nonce_service,
            .store = fixture.store,
            .replay_ledger = std::make_shared<security::NonceReplayLedger>(
                fixture.nonce_service->Ttl() - std::chrono::seconds(1),
                fixture.nonce_service->Ttl(), fixture.clock)});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(IdentityFailureType::Configuration));
    }
    SECTION("Empty name falls back to the default guard name") {
        auto guard = fixture.MakeGuard(false, "");
        REQUIRE(guard->Name() == "key");
    }
    SECTION("New guard is anonymous") {
        auto guard = fixture.MakeGuard();
        REQUIRE(guard->State() == GuardState::Anonymous);
        REQUIRE(guard->Guest());
        REQUIRE_FALSE(guard->Check());
        REQUIRE_FALSE(guard->User());
        REQUIRE_FALSE(guard->Id().has_value());
    }
}
TEST_CASE("KeyGuard - Credentials flow", "[guard]") {
    GuardFixture fixture;
    auto record = fixture.MakeManager().Register(kAlice, kAlicePassphrase).Unwrap();
    fixture.events->Clear();
    auto guard = fixture.MakeGuard();

    SECTION("Validate checks without changing state") {
        REQUIRE(guard->Validate({kAlice, kAlicePassphrase}));
        REQUIRE_FALSE(guard->Validate({kAlice, "wrong passphrase"}));
        REQUIRE_FALSE(guard->Validate({"", kAlicePassphrase}));
        REQUIRE_FALSE(guard->Validate({kAlice, ""}));
        REQUIRE(guard->State() == GuardState::Anonymous);
        REQUIRE(fixture.events->Events().empty());
    }
    SECTION("Successful attempt logs the user in") {
        REQUIRE(guard->Attempt({"  ALICE@example.com", kAlicePassphrase}));
        REQUIRE(guard->Check());
        REQUIRE(guard->State() == GuardState::Authenticated);
        REQUIRE(guard->User() == record);
        REQUIRE(guard->Id() == record->GetAuthIdentifier());

        const auto events = fixture.events->Events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].kind == EventKind::Attempting);
        REQUIRE(events[0].guard == "web");
        REQUIRE(events[0].email == kAlice);
        REQUIRE(events[1].kind == EventKind::Succeeded);
        REQUIRE(events[1].identifier == record->GetAuthIdentifier());
    }
    SECTION("Failed attempt leaves state unchanged") {
        REQUIRE_FALSE(guard->Attempt({kAlice, "wrong passphrase"}));
        REQUIRE(guard->State() == GuardState::Anonymous);
        REQUIRE(fixture.events->Count(EventKind::Attempting) == 1);
        REQUIRE(fixture.events->Count(EventKind::Failed) == 1);
        REQUIRE(fixture.events->Count(EventKind::Succeeded) == 0);
    }
    SECTION("Failed attempt does not log out an authenticated guard") {
        REQUIRE(guard->Attempt({kAlice, kAlicePassphrase}));
        REQUIRE_FALSE(guard->Attempt({kAlice, "wrong passphrase"}));
        REQUIRE(guard->Check());
    }
    SECTION("Unknown email fails") {
        REQUIRE_FALSE(guard->Attempt({"nobody@example.com", kAlicePassphrase}));
        REQUIRE(fixture.events->Count(EventKind::Failed) == 1);
    }
    SECTION("Logout returns to anonymous") {
        REQUIRE(guard->Attempt({kAlice, kAlicePassphrase}));
        guard->Logout();
        REQUIRE(guard->Guest());
        REQUIRE(guard->State() == GuardState::Anonymous);
        REQUIRE_FALSE(guard->User());
    }
    SECTION("SetUser authenticates directly and null logs out") {
        guard->SetUser(record);
        REQUIRE(guard->Check());
        REQUIRE(guard->Id() == record->GetAuthIdentifier());
        guard->SetUser(nullptr);
        REQUIRE(guard->Guest());
    }
}
TEST_CASE("KeyGuard - Signature flow", "[guard][nonce]") {
    GuardFixture fixture;
    auto record = fixture.MakeManager().Register(kAlice, kAlicePassphrase).Unwrap();
    fixture.events->Clear();
    auto guard = fixture.MakeGuard();

    SECTION("Challenge moves to pending") {
        REQUIRE(guard->Attempt({kAlice, kAlicePassphrase}));
        const std::string nonce = guard->Challenge(kAlice);
        REQUIRE(guard->State() == GuardState::Pending);
        REQUIRE_FALSE(guard->Check());
        REQUIRE(fixture.nonce_service->Validate(kAlice, nonce));
    }
    SECTION("Valid signature authenticates") {
        const std::string nonce = guard->Challenge("Alice@Example.com");
        const std::string signature = fixture.SignAs(kAlice, kAlicePassphrase, nonce);
        REQUIRE(guard->AuthenticateWithSignature(kAlice, signature, nonce));
        REQUIRE(guard->State() == GuardState::Authenticated);
        REQUIRE(guard->User() == record);
        REQUIRE(fixture.events->Count(EventKind::Succeeded) == 1);
    }
    SECTION("Signature from the wrong passphrase is rejected") {
        const std::string nonce = guard->Challenge(kAlice);
        const std::string signature = fixture.SignAs(kAlice, "wrong passphrase", nonce);
        REQUIRE_FALSE(guard->AuthenticateWithSignature(kAlice, signature, nonce));
        REQUIRE(guard->State() == GuardState::Rejected);
        REQUIRE_FALSE(guard->User());
        REQUIRE(fixture.events->Count(EventKind::Failed) == 1);
    }
    SECTION("Expired nonce is rejected") {
        const std::string nonce = guard->Challenge(kAlice);
        const std::string signature = fixture.SignAs(kAlice, kAlicePassphrase, nonce);
        fixture.clock->Advance(fixture.nonce_service->Ttl() + std::chrono::seconds(1));
        REQUIRE_FALSE(guard->AuthenticateWithSignature(kAlice, signature, nonce));
        REQUIRE(guard->State() == GuardState::Rejected);
    }
    SECTION("Nonce issued for another identifier is rejected") {
        const std::string nonce = guard->Challenge("bob@example.com");
        const std::string signature = fixture.SignAs(kAlice, kAlicePassphrase, nonce);
        REQUIRE_FALSE(guard->AuthenticateWithSignature(kAlice, signature, nonce));
    }
    SECTION("Garbage signature is rejected") {
        const std::string nonce = guard->Challenge(kAlice);
        REQUIRE_FALSE(guard->AuthenticateWithSignature(kAlice, "not-base64!", nonce));
        REQUIRE_FALSE(guard->AuthenticateWithSignature(kAlice, "", nonce));
    }
    SECTION("Without a ledger a nonce may be reused inside its window") {
        const std::string nonce = guard->Challenge(kAlice);
        const std::string signature = fixture.SignAs(kAlice, kAlicePassphrase, nonce);
        REQUIRE(guard->AuthenticateWithSignature(kAlice, signature, nonce));
        auto second = fixture.MakeGuard();
        REQUIRE(second->AuthenticateWithSignature(kAlice, signature, nonce));
    }
    SECTION("With a ledger a nonce is accepted once") {
        auto first = fixture.MakeGuard(true);
        auto second = fixture.MakeGuard(true);
        const std::string nonce = first->Challenge(kAlice);
        const std::string signature = fixture.SignAs(kAlice, kAlicePassphrase, nonce);
        REQUIRE(first->AuthenticateWithSignature(kAlice, signature, nonce));
        REQUIRE_FALSE(second->AuthenticateWithSignature(kAlice, signature, nonce));
        REQUIRE(second->State() == GuardState::Rejected);
        REQUIRE(fixture.ledger->TrackedCount() == 1);
    }
    SECTION("Rejected signatures do not consume the nonce") {
        auto ledger_guard = fixture.MakeGuard(true);
        const std::string nonce = ledger_guard->Challenge(kAlice);
        const std::string bad = fixture.SignAs(kAlice, "wrong passphrase", nonce);
        REQUIRE_FALSE(ledger_guard->AuthenticateWithSignature(kAlice, bad, nonce));
        REQUIRE(fixture.ledger->TrackedCount() == 0);
        const std::string good = fixture.SignAs(kAlice, kAlicePassphrase, nonce);
        REQUIRE(ledger_guard->AuthenticateWithSignature(kAlice, good, nonce));
    }
}
