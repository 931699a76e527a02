// CHAINSYNC - In-Memory Database
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#ifndef CHAINSYNC_DB_MEMORY_H
#define CHAINSYNC_DB_MEMORY_H

#include <chainsync/db/database.h>

#include <map>
#include <mutex>

namespace chainsync {
namespace db {

/**
 * Ordered in-memory store. Default backing for the response cache and
 * the wallet state store.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace chainsync

#endif // CHAINSYNC_DB_MEMORY_H
