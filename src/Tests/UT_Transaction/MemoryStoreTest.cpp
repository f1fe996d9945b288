//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/EphemeralKeyPair.hpp"
#include "Components/Transaction/MemoryStore.hpp"
#include "Components/Transaction/Record.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Transaction::Record CreateRecord(std::string const& identifier);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::chrono::seconds Lifetime{ 1200 };

static inline std::string const Identifier = "0f8fad5b-d9cb-469f-a165-70867728950e";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, PutAndGetTest)
{
    Transaction::MemoryStore store;
    auto const record = local::CreateRecord(test::Identifier);
    store.Put(test::Identifier, record, test::Lifetime);
    EXPECT_EQ(store.Size(), std::size_t{ 1 });

    auto const optRecord = store.Get(test::Identifier);
    ASSERT_TRUE(optRecord);
    EXPECT_EQ(optRecord->acsTransactionId, record.acsTransactionId);
    EXPECT_EQ(optRecord->threeDsServerTransactionId, record.threeDsServerTransactionId);
    EXPECT_EQ(optRecord->sdkTransactionId, record.sdkTransactionId);
    EXPECT_EQ(optRecord->acsReferenceNumber, record.acsReferenceNumber);
    EXPECT_EQ(optRecord->sdkPublicKey, record.sdkPublicKey);
    EXPECT_EQ(optRecord->spAcsKeyPair, record.spAcsKeyPair); // The key pair is shared, never copied.
    EXPECT_FALSE(optRecord->optOutcome);

    EXPECT_FALSE(store.Get("unknown"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ReplaceTest)
{
    Transaction::MemoryStore store;
    auto record = local::CreateRecord(test::Identifier);
    store.Put(test::Identifier, record, test::Lifetime);

    record.optOutcome = Transaction::Outcome{ "Y", "02", "AAAAAAAAAAAAAAAAAAAAAAAAAAA=" };
    store.Put(test::Identifier, record, test::Lifetime);
    EXPECT_EQ(store.Size(), std::size_t{ 1 });

    auto const optRecord = store.Get(test::Identifier);
    ASSERT_TRUE(optRecord && optRecord->optOutcome);
    EXPECT_EQ(optRecord->optOutcome->status, "Y");
    EXPECT_EQ(optRecord->optOutcome->eci, "02");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, EraseTest)
{
    Transaction::MemoryStore store;
    store.Put(test::Identifier, local::CreateRecord(test::Identifier), test::Lifetime);

    EXPECT_TRUE(store.Erase(test::Identifier));
    EXPECT_FALSE(store.Get(test::Identifier));
    EXPECT_FALSE(store.Erase(test::Identifier));
    EXPECT_EQ(store.Size(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ExpirationTest)
{
    Transaction::MemoryStore store;
    store.Put(test::Identifier, local::CreateRecord(test::Identifier), std::chrono::seconds{ 0 });
    EXPECT_FALSE(store.Get(test::Identifier));
    EXPECT_EQ(store.Size(), std::size_t{ 0 });

    std::string const alive = "7c9e6679-7425-40de-944b-e07fc1f90ae7";
    store.Put(alive, local::CreateRecord(alive), test::Lifetime);
    EXPECT_TRUE(store.Get(alive));

    // Writing a new entry prunes the expired one.
    EXPECT_EQ(store.Prune(), std::size_t{ 0 });
    EXPECT_EQ(store.Size(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, PruneTest)
{
    Transaction::MemoryStore store;
    store.Put(test::Identifier, local::CreateRecord(test::Identifier), std::chrono::seconds{ 1 });
    EXPECT_TRUE(store.Get(test::Identifier));

    std::this_thread::sleep_for(std::chrono::milliseconds{ 1100 });
    EXPECT_FALSE(store.Get(test::Identifier));
    EXPECT_EQ(store.Prune(), std::size_t{ 1 });
    EXPECT_EQ(store.Prune(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ConcurrentAccessTest)
{
    constexpr std::size_t ThreadCount = 8;
    constexpr std::size_t IterationCount = 64;

    auto const spStore = std::make_shared<Transaction::MemoryStore>();
    auto const record = local::CreateRecord(test::Identifier);
    std::atomic_size_t found = 0;

    std::vector<std::thread> threads;
    for (std::size_t thread = 0; thread < ThreadCount; ++thread) {
        threads.emplace_back([&, thread] () {
            for (std::size_t iteration = 0; iteration < IterationCount; ++iteration) {
                auto const identifier = std::to_string(thread) + "-" + std::to_string(iteration);
                spStore->Put(identifier, record, test::Lifetime);
                if (spStore->Get(identifier)) { ++found; }
            }
        });
    }

    for (auto& thread : threads) { thread.join(); }

    EXPECT_EQ(found.load(), ThreadCount * IterationCount);
    EXPECT_EQ(spStore->Size(), ThreadCount * IterationCount);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, UpdateTest)
{
    Transaction::MemoryStore store;
    store.Put(test::Identifier, local::CreateRecord(test::Identifier), test::Lifetime);

    EXPECT_TRUE(store.Update(test::Identifier, [] (Transaction::Record& record) -> bool {
        record.optOutcome = Transaction::Outcome{ "Y", "02", "AgF5ipusvc7f8AESIzRFVmd4iZo=" };
        return true;
    }));

    // A declined update must not leak its partial changes into the store.
    EXPECT_FALSE(store.Update(test::Identifier, [] (Transaction::Record& record) -> bool {
        record.optOutcome->status = "N";
        return false;
    }));

    auto const optRecord = store.Get(test::Identifier);
    ASSERT_TRUE(optRecord && optRecord->optOutcome);
    EXPECT_EQ(optRecord->optOutcome->status, "Y");
    EXPECT_EQ(optRecord->optOutcome->eci, "02");

    bool invoked = false;
    auto const accept = [&invoked] (Transaction::Record&) -> bool { invoked = true; return true; };
    EXPECT_FALSE(store.Update("unknown", accept));
    EXPECT_FALSE(invoked);

    store.Put(test::Identifier, local::CreateRecord(test::Identifier), std::chrono::seconds{ 0 });
    EXPECT_FALSE(store.Update(test::Identifier, accept));
    EXPECT_FALSE(invoked);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ConcurrentUpdateTest)
{
    constexpr std::size_t ThreadCount = 8;

    auto const spStore = std::make_shared<Transaction::MemoryStore>();
    spStore->Put(test::Identifier, local::CreateRecord(test::Identifier), test::Lifetime);
    std::atomic_size_t recorded = 0;

    std::vector<std::thread> threads;
    for (std::size_t thread = 0; thread < ThreadCount; ++thread) {
        threads.emplace_back([&, thread] () {
            bool const updated = spStore->Update(test::Identifier, [thread] (Transaction::Record& record) -> bool {
                if (record.optOutcome) { return false; }
                record.optOutcome = Transaction::Outcome{ std::to_string(thread), "02", {} };
                return true;
            });
            if (updated) { ++recorded; }
        });
    }

    for (auto& thread : threads) { thread.join(); }

    // Exactly one writer wins and its outcome is the one that remains.
    EXPECT_EQ(recorded.load(), std::size_t{ 1 });
    auto const optRecord = spStore->Get(test::Identifier);
    ASSERT_TRUE(optRecord && optRecord->optOutcome);
    EXPECT_FALSE(optRecord->optOutcome->status.empty());
}

//----------------------------------------------------------------------------------------------------------------------

Transaction::Record local::CreateRecord(std::string const& identifier)
{
    auto const spAcsKeyPair = std::make_shared<Security::EphemeralKeyPair const>(Security::GenerateEphemeralKeyPair());
    auto const sdk = Security::GenerateEphemeralKeyPair();
    return Transaction::Record{
        .acsTransactionId = identifier,
        .threeDsServerTransactionId = "8a880dc0-d2d2-4067-bcb1-b08d1690b26e",
        .sdkTransactionId = "b2385523-a66c-4907-ac3c-91848e8c0067",
        .acsReferenceNumber = "issuer1",
        .spAcsKeyPair = spAcsKeyPair,
        .sdkPublicKey = sdk.GetPublicKey(),
        .optOutcome = std::nullopt
    };
}

//----------------------------------------------------------------------------------------------------------------------
