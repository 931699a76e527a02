// CHAINSYNC - Database Tests
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <gtest/gtest.h>
#include "chainsync/db/database.h"
#include "chainsync/db/memory.h"

#include <string>
#include <vector>

using namespace chainsync;
using namespace chainsync::db;

// ============================================================================
// Status and Slice Tests
// ============================================================================

TEST(StatusTest, Codes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_EQ(Status::Ok().ToString(), "OK");

    Status nf = Status::NotFound("key");
    EXPECT_FALSE(nf.ok());
    EXPECT_TRUE(nf.IsNotFound());
    EXPECT_EQ(nf.ToString(), "NotFound: key");

    EXPECT_TRUE(Status::Corruption().IsCorruption());
    EXPECT_TRUE(Status::IOError("disk").IsIOError());
    EXPECT_EQ(Status::InvalidArgument("x").code(), Status::INVALID_ARGUMENT);
}

TEST(SliceTest, Basics) {
    std::string owned = "cache:tx";
    Slice s(owned);
    EXPECT_EQ(s.size(), owned.size());
    EXPECT_TRUE(s.starts_with("cache"));
    EXPECT_FALSE(s.starts_with("cache:tx:long"));
    EXPECT_EQ(s.ToString(), owned);
    EXPECT_TRUE(Slice().empty());
}

TEST(SliceTest, Ordering) {
    EXPECT_LT(Slice("a").compare(Slice("b")), 0);
    EXPECT_LT(Slice("ab").compare(Slice("abc")), 0);
    EXPECT_EQ(Slice("abc").compare(Slice("abc")), 0);
    EXPECT_TRUE(Slice("abc") == Slice("abc"));
    EXPECT_TRUE(Slice("abc") != Slice("abd"));
}

TEST(KeyTest, MakeKey) {
    EXPECT_EQ(MakeKey(prefix::WATCHED, "external"), "wexternal");
    EXPECT_EQ(MakeKey(prefix::SYNC_STATE), "s");
    EXPECT_EQ(MakeKey(prefix::CACHE_ENTRY, "tx:ab").front(), 'c');
}

TEST(WriteBatchTest, RecordsOperationsInOrder) {
    WriteBatch batch;
    EXPECT_TRUE(batch.Empty());
    batch.Put("k1", "v1");
    batch.Delete("k2");
    EXPECT_EQ(batch.Count(), 2u);

    std::vector<std::string> seen;
    batch.Iterate([&seen](const std::string& key, const std::optional<std::string>& value) {
        seen.push_back(key + (value ? "=" + *value : " deleted"));
    });
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "k1=v1");
    EXPECT_EQ(seen[1], "k2 deleted");

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

// ============================================================================
// Memory Database Tests
// ============================================================================

class MemoryDatabaseTest : public ::testing::Test {
protected:
    MemoryDatabase db_;
};

TEST_F(MemoryDatabaseTest, PutGetDelete) {
    ASSERT_TRUE(db_.Put("key", "value").ok());

    std::string value;
    ASSERT_TRUE(db_.Get("key", &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_TRUE(db_.Exists("key"));

    ASSERT_TRUE(db_.Delete("key").ok());
    EXPECT_TRUE(db_.Get("key", &value).IsNotFound());
    EXPECT_FALSE(db_.Exists("key"));
}

TEST_F(MemoryDatabaseTest, DeleteMissingIsOk) {
    EXPECT_TRUE(db_.Delete("absent").ok());
}

TEST_F(MemoryDatabaseTest, Overwrite) {
    db_.Put("k", "1");
    db_.Put("k", "2");
    std::string value;
    db_.Get("k", &value);
    EXPECT_EQ(value, "2");
    EXPECT_EQ(db_.Size(), 1u);
}

TEST_F(MemoryDatabaseTest, BinaryValues) {
    std::string raw("a\0b", 3);
    db_.Put("bin", raw);
    std::string value;
    ASSERT_TRUE(db_.Get("bin", &value).ok());
    EXPECT_EQ(value.size(), 3u);
    EXPECT_EQ(value, raw);
}

TEST_F(MemoryDatabaseTest, BatchWrite) {
    db_.Put("stale", "x");

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("stale");
    ASSERT_TRUE(db_.Write(&batch).ok());

    EXPECT_TRUE(db_.Exists("a"));
    EXPECT_TRUE(db_.Exists("b"));
    EXPECT_FALSE(db_.Exists("stale"));
}

TEST_F(MemoryDatabaseTest, IteratorOrderAndSeek) {
    db_.Put(MakeKey(prefix::WATCHED, "internal"), "[]");
    db_.Put(MakeKey(prefix::WATCHED, "external"), "[]");
    db_.Put(MakeKey(prefix::TOTALS), "{}");
    db_.Put(MakeKey(prefix::SYNC_STATE), "{}");

    auto it = db_.NewIterator();
    std::vector<std::string> keys;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    ASSERT_EQ(keys.size(), 4u);
    EXPECT_EQ(keys[0], "s");
    EXPECT_EQ(keys[1], "t");
    EXPECT_EQ(keys[2], "wexternal");

    it->Seek("w");
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "wexternal");
    EXPECT_TRUE(it->status().ok());
}

TEST_F(MemoryDatabaseTest, IteratorIsSnapshot) {
    db_.Put("a", "1");
    auto it = db_.NewIterator();
    db_.Put("b", "2");
    db_.Delete("a");

    it->SeekToFirst();
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "a");
    it->Next();
    EXPECT_FALSE(it->Valid());
}

TEST_F(MemoryDatabaseTest, Clear) {
    db_.Put("a", "1");
    db_.Put("b", "2");
    db_.Clear();
    EXPECT_EQ(db_.Size(), 0u);
}
