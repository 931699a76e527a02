// CHAINSYNC - Database Abstraction Layer
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Abstract key-value store used by the response cache and the persisted
// wallet state. Implementations: MemoryDatabase, LevelDBDatabase.

#ifndef CHAINSYNC_DB_DATABASE_H
#define CHAINSYNC_DB_DATABASE_H

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chainsync {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result;
        switch (code_) {
            case NOT_FOUND: result = "NotFound: "; break;
            case CORRUPTION: result = "Corruption: "; break;
            case NOT_SUPPORTED: result = "NotSupported: "; break;
            case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
            case IO_ERROR: result = "IOError: "; break;
            default: result = "Unknown: "; break;
        }
        return result + message_;
    }
};

// ============================================================================
// Slice - A reference to a byte range
// ============================================================================

/**
 * A lightweight reference to a contiguous range of bytes.
 * Does not own the data; the underlying buffer must outlive the Slice.
 */
class Slice {
private:
    const char* data_;
    size_t size_;

public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    int compare(const Slice& b) const {
        size_t min_len = std::min(size_, b.size_);
        int r = memcmp(data_, b.data_, min_len);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && memcmp(data_, b.data_, size_) == 0;
    }

    bool operator!=(const Slice& b) const { return !(*this == b); }
    bool operator<(const Slice& b) const { return compare(b) < 0; }
};

// ============================================================================
// Database Options
// ============================================================================

struct Options {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;

    /// Throw error if database already exists
    bool error_if_exists = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;

    /// LRU cache size for blocks (default 8MB)
    size_t block_cache_size = 8 * 1024 * 1024;

    /// Bloom filter bits per key (0 to disable)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    /// Verify checksums on reads
    bool verify_checksums = false;

    /// Fill the cache on reads
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;

public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }

    /// Visit operations in order; a nullopt value means delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }
};

// ============================================================================
// Iterator - Database iterator interface
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Seek to the first key >= target
    virtual void Seek(const Slice& target) = 0;

    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database - Abstract database interface
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;

    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;

    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;

    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;

    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
};

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    constexpr char CACHE_ENTRY = 'c';     // cache key -> {"v":value,"e":expiry}
    constexpr char WATCHED = 'w';         // role -> watched script hashes
    constexpr char SYNC_STATE = 's';      // -> per-role scan positions
    constexpr char TOTALS = 't';          // -> aggregate ledger
}

inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

} // namespace db
} // namespace chainsync

#endif // CHAINSYNC_DB_DATABASE_H
