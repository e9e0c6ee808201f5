/**
 * @file protected_roster_example.cpp
 * @brief Enroll, store an encrypted roster, lock, unlock and read it back
 */

#include "phivault/codec/blob_codec.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/session/protected_data_client.hpp"
#include "phivault/storage/in_memory_protected_storage.hpp"

#include <iostream>
#include <memory>

using namespace phivault::keystore;
using namespace phivault::keystore::session;
namespace proto = phivault::proto;

namespace {

proto::ProtectedRecord SampleRoster() {
    proto::ProtectedRecord record;
    auto* roster = record.mutable_roster();

    auto* alex = roster->add_students();
    alex->set_student_id("s-001");
    alex->set_first_name("Alex");
    alex->set_last_name("Rivera");
    alex->add_accommodations("front row seating");

    auto* sam = roster->add_students();
    sam->set_student_id("s-002");
    sam->set_first_name("Samantha");
    sam->set_last_name("Okafor");
    sam->set_preferred_name("Sam");
    return record;
}

int Fail(const char* step, const VaultFailure& failure) {
    std::cerr << "   " << step << " failed: " << failure.message << std::endl;
    return 1;
}

}

int main() {
    std::cout << "=== PhiVault - Protected Roster Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    auto storage = std::make_shared<storage::InMemoryProtectedStorage>();
    auto client_result = ProtectedDataClient::Create(storage, "teacher-42");
    if (client_result.IsErr()) {
        return Fail("Create client", client_result.UnwrapErr());
    }
    auto client = std::move(client_result).Unwrap();

    std::cout << "2. Enrolling (Argon2id, this takes a moment)..." << std::endl;
    if (auto enrolled = client->Enroll("correct-horse"); enrolled.IsErr()) {
        return Fail("Enroll", enrolled.UnwrapErr());
    }
    std::cout << "   ✓ Session active" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Saving an encrypted roster..." << std::endl;
    auto created = client->CreateRecord("Period 3 Biology", SampleRoster());
    if (created.IsErr()) {
        return Fail("CreateRecord", created.UnwrapErr());
    }
    const std::string record_id = created.Unwrap().record_id();
    std::cout << "   ✓ Stored record " << record_id << std::endl;

    auto stored = storage->GetRecord(client->OwnerId(), record_id);
    if (stored.IsErr()) {
        return Fail("GetRecord", stored.UnwrapErr());
    }
    auto wire = codec::BlobCodec::ToWireJson(stored.Unwrap().blob());
    if (wire.IsErr()) {
        return Fail("ToWireJson", wire.UnwrapErr());
    }
    std::cout << "   Backend sees: " << wire.Unwrap() << std::endl;
    std::cout << std::endl;

    std::cout << "4. Locking and retrying with the wrong secret..." << std::endl;
    client->Lock();
    if (auto wrong = client->Unlock("wrong-horse"); wrong.IsErr()) {
        std::cout << "   ✓ Rejected: " << wrong.UnwrapErr().UserMessage() << std::endl;
    } else {
        std::cerr << "   Wrong secret was accepted" << std::endl;
        return 1;
    }
    std::cout << std::endl;

    std::cout << "5. Unlocking and reading the roster back..." << std::endl;
    if (auto unlocked = client->Unlock("correct-horse"); unlocked.IsErr()) {
        return Fail("Unlock", unlocked.UnwrapErr());
    }
    auto loaded = client->LoadRecord(record_id);
    if (loaded.IsErr()) {
        return Fail("LoadRecord", loaded.UnwrapErr());
    }
    for (const auto& student : loaded.Unwrap().roster().students()) {
        std::cout << "   " << student.student_id() << "  "
                  << student.first_name() << " " << student.last_name() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "6. Setting up a recovery key..." << std::endl;
    auto recovery = client->SetupRecovery();
    if (recovery.IsErr()) {
        return Fail("SetupRecovery", recovery.UnwrapErr());
    }
    std::cout << "   ✓ Recovery key: [shown once to the user, " << recovery.Unwrap().size()
              << " characters]" << std::endl;

    client->Lock();
    std::cout << std::endl;
    std::cout << "=== Done ===" << std::endl;
    return 0;
}
