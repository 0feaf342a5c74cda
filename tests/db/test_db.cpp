// VELEDGER - Database Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "veledger/asset/token_ledger.h"
#include "veledger/db/database.h"
#include "veledger/db/ledger_store.h"
#include "veledger/db/leveldb.h"
#include "veledger/util/clock.h"
#include "veledger/util/config.h"

#include <filesystem>
#include <random>

using namespace veledger;
using namespace veledger::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("veledger_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

// ============================================================================
// Memory Backend
// ============================================================================

TEST_F(DatabaseTest, MemoryPutGetDelete) {
    MemoryDatabase db;
    std::string value;

    EXPECT_TRUE(db.Get("missing", &value).IsNotFound());
    ASSERT_TRUE(db.Put("key", "value").ok());
    ASSERT_TRUE(db.Get("key", &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_TRUE(db.Exists("key"));

    ASSERT_TRUE(db.Delete("key").ok());
    EXPECT_FALSE(db.Exists("key"));
    EXPECT_EQ(db.Size(), 0u);
    EXPECT_EQ(db.GetDiskUsage(), 0u);
}

TEST_F(DatabaseTest, WriteBatchAppliesInOrder) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("stale", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("stale");
    batch.Put("a", "3");
    EXPECT_EQ(batch.Count(), 4u);
    EXPECT_GT(batch.ApproximateSize(), 0u);

    ASSERT_TRUE(db.Write(&batch).ok());
    std::string value;
    ASSERT_TRUE(db.Get("a", &value).ok());
    EXPECT_EQ(value, "3");
    EXPECT_FALSE(db.Exists("stale"));
    EXPECT_EQ(db.Size(), 2u);

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

TEST_F(DatabaseTest, IteratorIsOrderedAndIsolated) {
    MemoryDatabase db;
    db.Put(MakeKey(prefix::OWNER, uint64_t{256}), "c");
    db.Put(MakeKey(prefix::OWNER, uint64_t{2}), "b");
    db.Put(MakeKey(prefix::POSITION, uint64_t{1}), "a");

    auto iter = db.NewIterator();
    db.Put(MakeKey(prefix::OWNER, uint64_t{3}), "late");

    std::vector<std::string> values;
    for (iter->Seek(MakeKey(prefix::OWNER)); iter->Valid(); iter->Next()) {
        if (!iter->key().starts_with(MakeKey(prefix::OWNER))) break;
        values.push_back(iter->value().ToString());
    }
    // Big-endian ids sort numerically; writes after creation are not visible
    EXPECT_EQ(values, std::vector<std::string>({"b", "c"}));
    EXPECT_TRUE(iter->status().ok());
}

TEST_F(DatabaseTest, SerializeHelpers) {
    std::string encoded = SerializeToString(static_cast<uint64_t>(42));
    uint64_t decoded = 0;
    EXPECT_TRUE(DeserializeFromString(encoded, decoded));
    EXPECT_EQ(decoded, 42u);

    EXPECT_FALSE(DeserializeFromString(encoded + "x", decoded));
    EXPECT_FALSE(DeserializeFromString(encoded.substr(0, 3), decoded));
}

TEST_F(DatabaseTest, StatusToString) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    Status status = Status::Corruption("bad row");
    EXPECT_TRUE(status.IsCorruption());
    EXPECT_NE(status.ToString().find("bad row"), std::string::npos);
}

// ============================================================================
// Backends
// ============================================================================

TEST_F(DatabaseTest, BackendNames) {
    EXPECT_STREQ(BackendToString(Backend::Memory), "memory");
    EXPECT_STREQ(BackendToString(Backend::LevelDB), "leveldb");
    EXPECT_EQ(ParseBackend("LevelDB"), std::optional<Backend>(Backend::LevelDB));
    EXPECT_EQ(ParseBackend("memory"), std::optional<Backend>(Backend::Memory));
    EXPECT_FALSE(ParseBackend("rocksdb").has_value());
    EXPECT_TRUE(IsBackendAvailable(Backend::Memory));
}

TEST_F(DatabaseTest, OpenMemoryBackend) {
    auto [status, db] = OpenDatabase(testDir_ / "ignored", Options(), Backend::Memory);
    ASSERT_TRUE(status.ok());
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->GetBackend(), Backend::Memory);
}

TEST_F(DatabaseTest, LevelDBPersistsOrReportsUnsupported) {
    std::filesystem::path path = testDir_ / "leveldb";

    if (!IsBackendAvailable(Backend::LevelDB)) {
        auto [status, db] = OpenDatabase(path, Options(), Backend::LevelDB);
        EXPECT_TRUE(status.IsNotSupported());
        EXPECT_EQ(db, nullptr);
        EXPECT_TRUE(DestroyDatabase(path, Backend::LevelDB).IsNotSupported());
        return;
    }

    {
        auto [status, db] = OpenDatabase(path, Options(), Backend::LevelDB);
        ASSERT_TRUE(status.ok()) << status.ToString();
        WriteOptions sync;
        sync.sync = true;
        ASSERT_TRUE(db->Put(sync, "persist", "yes").ok());
    }
    {
        auto [status, db] = OpenDatabase(path, Options(), Backend::LevelDB);
        ASSERT_TRUE(status.ok()) << status.ToString();
        std::string value;
        ASSERT_TRUE(db->Get("persist", &value).ok());
        EXPECT_EQ(value, "yes");
    }
    EXPECT_TRUE(DestroyDatabase(path, Backend::LevelDB).ok());
}

// ============================================================================
// Ledger Store
// ============================================================================

namespace {

constexpr Timestamp START = 1700000000;
const Address ESCROW = Address::FromLabel(300);
const Address REWARDS = Address::FromLabel(301);
const Address GOVERNANCE = Address::FromLabel(302);

} // namespace

class LedgerStoreTest : public DatabaseTest {
protected:
    LedgerStoreTest()
        : clock_(START),
          token_("TOKEN"),
          escrowCustody_(token_.Custody(ESCROW)),
          rewardCustody_(token_.Custody(REWARDS)),
          escrow_(Config(), clock_, *escrowCustody_, ESCROW),
          engine_(EngineConfig(), escrow_, clock_, *rewardCustody_, REWARDS),
          store_(std::make_unique<MemoryDatabase>()) {
        token_.Mint(alice_, 10000 * COIN);
        token_.Mint(bob_, 10000 * COIN);
        token_.Mint(REWARDS, 10000 * COIN);
    }

    static escrow::LedgerConfig Config() {
        escrow::LedgerConfig cfg;
        cfg.governance = GOVERNANCE;
        return cfg;
    }

    static rewards::RewardsConfig EngineConfig() {
        rewards::RewardsConfig cfg;
        cfg.baseEmissionRate = MULTIPLIER / 1000;
        return cfg;
    }

    /// A ledger touching every table
    void Populate() {
        TokenId a = escrow_.CreateLock(alice_, 1000 * COIN, 365 * DAY);
        escrow_.CreateLock(bob_, 2000 * COIN, 3 * 365 * DAY, true);
        clock_.AdvanceDays(1);
        escrow_.CreateLock(alice_, 500 * COIN, 2 * 365 * DAY);
        escrow_.Approve(alice_, carol_, a);
        escrow_.SetApprovalForAll(bob_, carol_, true);
        clock_.AdvanceDays(1);
        escrow_.Delegate(alice_, carol_);
        clock_.AdvanceWeeks(2);
        escrow_.Checkpoint();
        engine_.Claim(alice_, a, alice_);
    }

    util::ManualClock clock_;
    asset::TokenLedger token_;
    std::shared_ptr<escrow::IFungibleAsset> escrowCustody_;
    std::shared_ptr<escrow::IFungibleAsset> rewardCustody_;
    escrow::VotingEscrow escrow_;
    rewards::RewardEngine engine_;
    LedgerStore store_;

    Address alice_ = Address::FromLabel(1);
    Address bob_ = Address::FromLabel(2);
    Address carol_ = Address::FromLabel(3);
};

TEST_F(LedgerStoreTest, EmptyStoreLoadsNothing) {
    escrow::EscrowState state;
    EXPECT_FALSE(store_.HasState());
    EXPECT_FALSE(store_.Load(state));
    EXPECT_EQ(state.nextId, 1u);
}

TEST_F(LedgerStoreTest, SaveLoadRoundTrip) {
    Populate();
    escrow::EscrowState saved = escrow_.Snapshot();
    rewards::RewardEngine::State savedRewards = engine_.Export();
    store_.Save(saved, &savedRewards);
    EXPECT_TRUE(store_.HasState());
    EXPECT_TRUE(store_.HasRewardState());

    escrow::EscrowState loaded;
    rewards::RewardEngine::State loadedRewards;
    ASSERT_TRUE(store_.Load(loaded, &loadedRewards));

    EXPECT_EQ(loaded.nextId, saved.nextId);
    EXPECT_EQ(loaded.sequence, saved.sequence);
    EXPECT_EQ(loaded.owners, saved.owners);
    EXPECT_EQ(loaded.approvals, saved.approvals);
    EXPECT_EQ(loaded.operators, saved.operators);
    EXPECT_EQ(loaded.createdAt, saved.createdAt);
    EXPECT_EQ(loaded.nonVoting, saved.nonVoting);
    EXPECT_EQ(loaded.positions.locked, saved.positions.locked);
    EXPECT_EQ(loaded.positions.globalPoints, saved.positions.globalPoints);
    EXPECT_EQ(loaded.positions.userPoints, saved.positions.userPoints);
    EXPECT_EQ(loaded.positions.slopeChanges, saved.positions.slopeChanges);
    EXPECT_EQ(loaded.positions.supply, saved.positions.supply);
    EXPECT_EQ(loaded.delegation.delegates, saved.delegation.delegates);
    EXPECT_EQ(loaded.delegation.checkpoints, saved.delegation.checkpoints);
    EXPECT_EQ(loaded.delegation.nonces, saved.delegation.nonces);
    EXPECT_EQ(loadedRewards.lastClaim, savedRewards.lastClaim);
    EXPECT_EQ(loadedRewards.emissions.baseRates, savedRewards.emissions.baseRates);

    // A restored ledger answers queries exactly as the original
    escrow::VotingEscrow restored(Config(), clock_, *escrowCustody_, ESCROW);
    restored.Restore(loaded);
    EXPECT_EQ(restored.TotalPower(), escrow_.TotalPower());
    EXPECT_EQ(restored.GetVotes(carol_), escrow_.GetVotes(carol_));
    EXPECT_EQ(restored.TotalPowerAt(START + DAY), escrow_.TotalPowerAt(START + DAY));
}

TEST_F(LedgerStoreTest, SaveReplacesPreviousState) {
    Populate();
    store_.Save(escrow_.Snapshot());
    EXPECT_FALSE(store_.HasRewardState());

    clock_.Set(escrow_.Locked(1).end);
    escrow_.Withdraw(alice_, 1);
    store_.Save(escrow_.Snapshot());

    escrow::EscrowState loaded;
    ASSERT_TRUE(store_.Load(loaded));
    EXPECT_EQ(loaded.owners.count(1), 0u);
    EXPECT_EQ(loaded.positions.locked.count(1), 0u);
    EXPECT_EQ(loaded.approvals.count(1), 0u);
    EXPECT_EQ(loaded.positions.supply, escrow_.TotalLocked());
}

TEST_F(LedgerStoreTest, LoadLeavesRewardsUntouchedWhenAbsent) {
    Populate();
    store_.Save(escrow_.Snapshot());

    rewards::RewardEngine::State rewardsState;
    rewardsState.lastClaim[42] = FloorToDay(START);
    escrow::EscrowState loaded;
    ASSERT_TRUE(store_.Load(loaded, &rewardsState));
    EXPECT_EQ(rewardsState.lastClaim.size(), 1u);
}

TEST_F(LedgerStoreTest, CorruptRowsRejected) {
    Populate();
    store_.Save(escrow_.Snapshot());
    ASSERT_TRUE(store_.GetDatabase().Put(MakeKey(prefix::META, Slice("escrow")), "garbage").ok());

    escrow::EscrowState loaded;
    EXPECT_THROW(store_.Load(loaded), StorageError);
}

TEST_F(LedgerStoreTest, MissingEpochDetected) {
    Populate();
    store_.Save(escrow_.Snapshot());
    ASSERT_TRUE(store_.GetDatabase().Delete(MakeKey(prefix::GLOBAL_POINT, uint64_t{1})).ok());

    escrow::EscrowState loaded;
    EXPECT_THROW(store_.Load(loaded), StorageError);
}

TEST_F(LedgerStoreTest, OpenConfiguredBackend) {
    StoreConfig cfg;
    cfg.backend = Backend::Memory;
    auto store = LedgerStore::Open(cfg);
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(store->GetDatabase().GetBackend(), Backend::Memory);

    if (!IsBackendAvailable(Backend::LevelDB)) {
        cfg.backend = Backend::LevelDB;
        cfg.path = testDir_ / "ledger";
        EXPECT_THROW(LedgerStore::Open(cfg), StorageError);
    }
}

TEST(StoreConfigTest, FromConfig) {
    util::ConfigManager defaults;
    StoreConfig cfg = StoreConfig::FromConfig(defaults, "/var/lib/veledger");
    EXPECT_EQ(cfg.backend, Backend::Memory);
    EXPECT_EQ(cfg.path, std::filesystem::path("/var/lib/veledger/ledger"));

    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("[db]\nbackend = leveldb\npath = /srv/ledger\n").success);
    cfg = StoreConfig::FromConfig(config, "/var/lib/veledger");
    EXPECT_EQ(cfg.backend, Backend::LevelDB);
    EXPECT_EQ(cfg.path, std::filesystem::path("/srv/ledger"));

    util::ConfigManager bad;
    ASSERT_TRUE(bad.ParseString("[db]\nbackend = rocksdb\n").success);
    EXPECT_THROW(StoreConfig::FromConfig(bad, "/tmp"), PreconditionError);
}
