#include <gtest/gtest.h>
#include "store/trade_store.hpp"
#include "persistence/json_file_store.hpp"
#include "oracle/price_oracle.hpp"
#include "utils/ids.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace desk;

namespace {

class FailingDocumentStore : public DocumentStore {
public:
    std::optional<StoreDocument> load() override { return std::nullopt; }
    void save(const StoreDocument&) override { throw StoreError("read-only volume"); }
    std::string describe() const override { return "failing"; }
};

} // namespace

class TradeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<MemoryDocumentStore>();
        store_ = std::make_unique<TradeStore>(backend_, make_hash_seed_source());
    }

    std::shared_ptr<MemoryDocumentStore> backend_;
    std::unique_ptr<TradeStore> store_;
};

TEST_F(TradeStoreTest, CleanMutationDoesNotSave) {
    auto status = store_->mutate([](StoreTransaction& tx) {
        EXPECT_EQ(tx.find_user("nobody"), nullptr);
        EXPECT_FALSE(tx.find_seed("EUR/USD").has_value());
    });

    EXPECT_TRUE(status.ok);
    EXPECT_EQ(backend_->save_count(), 0);
}

TEST_F(TradeStoreTest, CommittedMutationIsVisibleAndSaved) {
    auto status = store_->mutate([](StoreTransaction& tx) {
        auto& user = tx.ensure_user("alice", Money::from_whole(1000));
        user.balance -= Money::from_whole(10);
        tx.mark_dirty();
    });

    ASSERT_TRUE(status.ok);
    EXPECT_EQ(backend_->save_count(), 1);
    EXPECT_EQ(store_->snapshot().users.at("alice").balance, Money::from_whole(990));

    auto saved = backend_->load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->users.at("alice").balance, Money::from_whole(990));
}

TEST_F(TradeStoreTest, RollbackDiscardsEverything) {
    auto status = store_->mutate([](StoreTransaction& tx) {
        tx.ensure_user("alice", Money::from_whole(1000));
        tx.seed_for("EUR/USD");
        tx.rollback();
    });

    EXPECT_TRUE(status.ok);
    EXPECT_TRUE(store_->snapshot().users.empty());
    EXPECT_FALSE(store_->find_seed("EUR/USD").has_value());
    EXPECT_EQ(backend_->save_count(), 0);
}

TEST_F(TradeStoreTest, SeedIsAssignedOnceAndStable) {
    int64_t first = 0;
    int64_t second = 0;
    store_->mutate([&](StoreTransaction& tx) { first = tx.seed_for("GBP/USD"); });
    store_->mutate([&](StoreTransaction& tx) { second = tx.seed_for("GBP/USD"); });

    EXPECT_EQ(first, oracle::hash_pair_seed("GBP/USD"));
    EXPECT_EQ(first, second);
    EXPECT_EQ(store_->find_seed("GBP/USD"), first);
    EXPECT_EQ(backend_->save_count(), 1);
}

TEST_F(TradeStoreTest, SnapshotSeesCommittedDocument) {
    store_->mutate([](StoreTransaction& tx) { tx.ensure_user("bob", Money::from_whole(5)); });

    auto doc = store_->snapshot();
    EXPECT_EQ(doc.users.size(), 1u);
    EXPECT_EQ(doc.users.at("bob").balance, Money::from_whole(5));
}

TEST_F(TradeStoreTest, LoadsExistingDocumentAtConstruction) {
    StoreDocument doc;
    doc.users["carol"].balance = Money::from_whole(42);
    doc.pair_seeds["EUR/USD"] = 7;

    auto backend = std::make_shared<MemoryDocumentStore>(doc);
    TradeStore store(backend, make_hash_seed_source());

    EXPECT_EQ(store.snapshot().users.at("carol").balance, Money::from_whole(42));
    EXPECT_EQ(store.find_seed("EUR/USD"), 7);
    EXPECT_EQ(store.backend().describe(), "memory");
}

TEST(TradeStoreFailureTest, FailedSaveLeavesDocumentUnchanged) {
    TradeStore store(std::make_shared<FailingDocumentStore>(), make_hash_seed_source());

    auto status = store.mutate([](StoreTransaction& tx) {
        tx.ensure_user("alice", Money::from_whole(1000));
    });

    EXPECT_FALSE(status.ok);
    EXPECT_EQ(status.error, "read-only volume");
    EXPECT_TRUE(store.snapshot().users.empty());
}

TEST(TradeStoreFailureTest, UnreadableBackendFailsConstruction) {
    std::string dir = "/tmp/test_optiondesk_trade_store_" + generate_uuid();
    std::filesystem::create_directories(dir);
    {
        std::ofstream file(dir + "/data.json");
        file << "{\"users\": 5}";
    }

    JsonFileStore::Config config;
    config.path = dir + "/data.json";
    auto backend = std::make_shared<JsonFileStore>(config);
    EXPECT_THROW({ TradeStore store(backend, make_hash_seed_source()); }, StoreError);

    std::filesystem::remove_all(dir);
}

TEST(TradeStoreSharedFileTest, MutationSeesOtherStoresSaves) {
    std::string dir = "/tmp/test_optiondesk_trade_store_" + generate_uuid();
    JsonFileStore::Config config;
    config.path = dir + "/data.json";

    TradeStore first(std::make_shared<JsonFileStore>(config), make_hash_seed_source());
    TradeStore second(std::make_shared<JsonFileStore>(config), make_hash_seed_source());

    ASSERT_TRUE(first.mutate([](StoreTransaction& tx) {
        tx.ensure_user("alice", Money::from_whole(1000)).balance -= Money::from_whole(600);
        tx.mark_dirty();
    }).ok);

    bool seen = false;
    ASSERT_TRUE(second.mutate([&](StoreTransaction& tx) {
        auto* user = tx.find_user("alice");
        seen = user != nullptr && user->balance == Money::from_whole(400);
        tx.seed_for("EUR/USD");
    }).ok);
    EXPECT_TRUE(seen);

    // Both writes survive: the second store saved on top of the first
    auto reloaded = JsonFileStore(config).load();
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->users.at("alice").balance, Money::from_whole(400));
    EXPECT_EQ(reloaded->pair_seeds.count("EUR/USD"), 1u);

    std::filesystem::remove_all(dir);
}

TEST(TradeStoreSharedFileTest, UnreadableReloadFailsMutation) {
    std::string dir = "/tmp/test_optiondesk_trade_store_" + generate_uuid();
    JsonFileStore::Config config;
    config.path = dir + "/data.json";
    config.max_backups = 0;

    TradeStore store(std::make_shared<JsonFileStore>(config), make_hash_seed_source());
    ASSERT_TRUE(store.mutate([](StoreTransaction& tx) { tx.seed_for("EUR/USD"); }).ok);

    {
        std::ofstream file(config.path);
        file << "{not json";
    }

    bool ran = false;
    auto status = store.mutate([&](StoreTransaction&) { ran = true; });
    EXPECT_FALSE(status.ok);
    EXPECT_FALSE(ran);
    EXPECT_EQ(store.find_seed("EUR/USD"), oracle::hash_pair_seed("EUR/USD"));

    std::filesystem::remove_all(dir);
}

TEST(SeedSourceTest, RandomSeedsStayInRange) {
    auto source = make_random_seed_source(10, 20);
    for (int i = 0; i < 200; ++i) {
        int64_t seed = source("EUR/USD");
        EXPECT_GE(seed, 10);
        EXPECT_LE(seed, 20);
    }
}

TEST(SeedSourceTest, RandomRejectsInvertedRange) {
    EXPECT_THROW(make_random_seed_source(5, 4), std::invalid_argument);
}
