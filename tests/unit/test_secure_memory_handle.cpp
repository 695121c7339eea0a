#include <catch2/catch_test_macros.hpp>
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include <vector>
#include <algorithm>
using namespace keyward::identity;
using namespace keyward::identity::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate valid size") {
        auto result = SecureMemoryHandle::Allocate(kEd25519SeedBytes);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == kEd25519SeedBytes);
    }
    SECTION("Cannot allocate zero bytes") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
    }
    SECTION("Default-constructed handle is invalid") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Size() == 0);
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
    SECTION("Move assignment transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(64).Unwrap();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
}
TEST_CASE("SecureMemoryHandle - Read and Write", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Round trip") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsOk());
        std::vector<uint8_t> out(32);
        REQUIRE(handle.Read(out).IsOk());
        REQUIRE(out == data);
    }
    SECTION("Short write zero-fills the rest") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xFF)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{1, 2}).IsOk());
        std::vector<uint8_t> out(8);
        REQUIRE(handle.Read(out).IsOk());
        REQUIRE(out == std::vector<uint8_t>{1, 2, 0, 0, 0, 0, 0, 0});
    }
    SECTION("Write larger than buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(32, 0x42)).IsErr());
    }
    SECTION("Read into short buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        std::vector<uint8_t> out(8);
        REQUIRE(handle.Read(out).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Wipe and Release", "[crypto][memory][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe zeroes the region in place") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(16, 0xAA)).IsOk());
        handle.Wipe();
        REQUIRE_FALSE(handle.IsInvalid());
        auto all_zero = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
        });
        REQUIRE(all_zero.IsOk());
        REQUIRE(all_zero.Unwrap());
    }
    SECTION("Release invalidates the handle") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        handle.Release();
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.WithReadAccess([](std::span<const uint8_t>) { return 0; }).IsErr());
        handle.Release();
        REQUIRE(handle.IsInvalid());
    }
}
