// CHAINSYNC - LevelDB Backend
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// On-disk Database implementation. Built as the chainsync_leveldb target
// when LevelDB is available.

#ifndef CHAINSYNC_DB_LEVELDB_H
#define CHAINSYNC_DB_LEVELDB_H

#include <chainsync/db/database.h>

#include <filesystem>

namespace leveldb {
class DB;
class Cache;
class FilterPolicy;
}

namespace chainsync {
namespace db {

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter);
    ~LevelDBDatabase() override;

    LevelDBDatabase(const LevelDBDatabase&) = delete;
    LevelDBDatabase& operator=(const LevelDBDatabase&) = delete;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

private:
    leveldb::DB* db_;
    leveldb::Cache* cache_;
    const leveldb::FilterPolicy* filter_policy_;
};

/**
 * Open a LevelDB database at the specified path.
 * @return Pair of (status, database pointer); the pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data at path
Status DestroyDatabase(const std::filesystem::path& path);

} // namespace db
} // namespace chainsync

#endif // CHAINSYNC_DB_LEVELDB_H
