// CHAINSYNC - LevelDB Backend Tests
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <gtest/gtest.h>
#include "chainsync/db/leveldb.h"
#include "chainsync/wallet/state_store.h"

#include <filesystem>
#include <random>

using namespace chainsync;
using namespace chainsync::db;

// ============================================================================
// Test Utilities
// ============================================================================

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("chainsync_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open() {
        auto [status, db] = OpenDatabase(testDir_ / "state");
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// Basic Database Tests
// ============================================================================

TEST_F(LevelDBTest, OpenAndClose) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    db.reset();
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "state"));
}

TEST_F(LevelDBTest, ErrorIfExists) {
    Open().reset();

    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_ / "state", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(LevelDBTest, PutGetDelete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put("key", "value").ok());
    std::string value;
    ASSERT_TRUE(db->Get("key", &value).ok());
    EXPECT_EQ(value, "value");

    ASSERT_TRUE(db->Delete("key").ok());
    EXPECT_TRUE(db->Get("key", &value).IsNotFound());
}

TEST_F(LevelDBTest, BatchAndIterator) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    WriteBatch batch;
    batch.Put(MakeKey(prefix::WATCHED, "external"), "[]");
    batch.Put(MakeKey(prefix::WATCHED, "internal"), "[]");
    batch.Put(MakeKey(prefix::TOTALS), "{}");
    ASSERT_TRUE(db->Write(&batch).ok());

    auto it = db->NewIterator();
    int watched = 0;
    for (it->Seek(MakeKey(prefix::WATCHED)); it->Valid(); it->Next()) {
        if (!it->key().starts_with(MakeKey(prefix::WATCHED))) break;
        ++watched;
    }
    EXPECT_EQ(watched, 2);
    EXPECT_TRUE(it->status().ok());
}

TEST_F(LevelDBTest, PersistsAcrossReopen) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        WriteOptions sync;
        sync.sync = true;
        ASSERT_TRUE(db->Put(sync, "durable", "yes").ok());
    }

    auto db = Open();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get("durable", &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(LevelDBTest, StateStoreSurvivesReopen) {
    {
        wallet::DatabaseStateStore store(Open());
        wallet::SyncState state = store.GetSyncState(wallet::SyncOptions{});
        state.external.path = "m/84'/0'/0'/0/7";
        state.external.gap = 2;
        store.SetSyncState(state);
    }

    wallet::DatabaseStateStore store(Open());
    auto state = store.GetSyncState(wallet::SyncOptions{});
    EXPECT_EQ(state.external.path, "m/84'/0'/0'/0/7");
    EXPECT_EQ(state.external.gap, 2);
}

TEST_F(LevelDBTest, Destroy) {
    Open().reset();
    EXPECT_TRUE(DestroyDatabase(testDir_ / "state").ok());

    Options opts;
    opts.create_if_missing = false;
    auto [status, db] = OpenDatabase(testDir_ / "state", opts);
    EXPECT_FALSE(status.ok());
}
