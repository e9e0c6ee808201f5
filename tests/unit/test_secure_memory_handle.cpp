#include <catch2/catch_test_macros.hpp>
#include "phivault/crypto/secure_memory_handle.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/constants.hpp"
#include "helpers/vault_fixtures.hpp"
#include <vector>
using namespace phivault::keystore;
using namespace phivault::keystore::crypto;
using phivault::keystore::test_helpers::HandleBytes;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate valid size") {
        auto result = SecureMemoryHandle::Allocate(kDekBytes);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == kDekBytes);
    }
    SECTION("New memory is zeroed") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE(HandleBytes(handle) == std::vector<uint8_t>(32, 0));
    }
    SECTION("Cannot allocate zero bytes") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("FromBytes copies the input") {
        const std::vector<uint8_t> data = {9, 8, 7, 6};
        auto handle = SecureMemoryHandle::FromBytes(data).Unwrap();
        REQUIRE(handle.Size() == data.size());
        REQUIRE(HandleBytes(handle) == data);
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto size = handle1.Size();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == size);
    }
    SECTION("Move assignment transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(64).Unwrap();
        auto size1 = handle1.Size();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == size1);
    }
}
TEST_CASE("SecureMemoryHandle - Read and Write", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Written data reads back") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsOk());
        std::vector<uint8_t> out(32);
        REQUIRE(handle.Read(out).IsOk());
        REQUIRE(out == data);
    }
    SECTION("Short write zero-fills the tail") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xAA)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{1, 2}).IsOk());
        REQUIRE(HandleBytes(handle) == std::vector<uint8_t>{1, 2, 0, 0, 0, 0, 0, 0});
    }
    SECTION("Write data larger than buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        std::vector<uint8_t> data(32, 0x42);
        auto result = handle.Write(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Read into a short buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> out(16);
        REQUIRE(handle.Read(out).IsErr());
    }
    SECTION("Operations on a moved-from handle fail") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto moved = std::move(handle);
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsErr());
        REQUIRE(handle.WithReadAccess([](std::span<const uint8_t>) {}).IsErr());
        REQUIRE_FALSE(moved.IsInvalid());
    }
}
TEST_CASE("SecureMemoryHandle - Scoped Access", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("WithWriteAccess then WithReadAccess") {
        auto handle = SecureMemoryHandle::Allocate(4).Unwrap();
        auto written = handle.WithWriteAccess([](std::span<uint8_t> bytes) {
            for (size_t i = 0; i < bytes.size(); ++i) {
                bytes[i] = static_cast<uint8_t>(i + 1);
            }
        });
        REQUIRE(written.IsOk());
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            int total = 0;
            for (const auto b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.IsOk());
        REQUIRE(sum.Unwrap() == 10);
    }
    SECTION("Access to a reset handle fails") {
        auto handle = SecureMemoryHandle::Allocate(4).Unwrap();
        handle.Reset();
        REQUIRE(handle.IsInvalid());
        auto result = handle.WithReadAccess([](std::span<const uint8_t>) { return 0; });
        REQUIRE(result.IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Constant Time Equality", "[crypto][memory][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> data(32, 0x11);
    auto a = SecureMemoryHandle::FromBytes(data).Unwrap();
    auto b = SecureMemoryHandle::FromBytes(data).Unwrap();
    auto c = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(32, 0x12)).Unwrap();
    REQUIRE(a.ConstantTimeEquals(b).Unwrap());
    REQUIRE_FALSE(a.ConstantTimeEquals(c).Unwrap());
    c.Reset();
    REQUIRE(a.ConstantTimeEquals(c).IsErr());
}
