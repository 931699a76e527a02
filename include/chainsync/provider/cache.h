// CHAINSYNC - Response Cache
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Key/value cache for node responses with per-entry expiry and a bounded
// entry count. The oldest inserted key is evicted first.

#ifndef CHAINSYNC_PROVIDER_CACHE_H
#define CHAINSYNC_PROVIDER_CACHE_H

#include <chainsync/db/database.h>
#include <chainsync/rpc/json.h>
#include <chainsync/util/time.h>

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chainsync {

namespace util {
class Scheduler;
}

namespace provider {

class ResponseCache {
public:
    struct Config {
        util::Milliseconds expiry{300000};        // Default lifetime of an entry
        size_t maxSize{10000};                    // Maximum number of entries
        util::Milliseconds sweepInterval{60000};  // Period of the expiry sweep
    };

    ResponseCache();

    /**
     * @param scheduler Runs the periodic sweep; no sweep is scheduled if null
     * @param store Backing store; an in-memory database if null. Live
     *        entries already in it are indexed oldest expiry first, and
     *        expired or unreadable ones are removed.
     */
    explicit ResponseCache(const Config& config,
                           util::Scheduler* scheduler = nullptr,
                           std::unique_ptr<db::Database> store = nullptr);
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /**
     * Insert or overwrite an entry.
     * @param expiryMillis Absolute expiry in Unix millis. If absent, a
     *        numeric "expiry" field on an object value is used, else the
     *        configured default lifetime.
     */
    void Set(const std::string& key, const rpc::JSONValue& value,
             std::optional<int64_t> expiryMillis = std::nullopt);

    /// Value if present and not expired
    std::optional<rpc::JSONValue> Get(const std::string& key);

    /// Remove every expired entry; returns the number removed
    size_t Sweep();

    void Clear();

    /// Cancel the sweep and release the store. The cache must not be used after.
    void Stop();

    size_t Size() const;
    bool IsStopped() const;
    const Config& GetConfig() const { return config_; }

private:
    void LoadIndex();
    void EraseLocked(const std::string& key);
    void CheckRunning() const;

    Config config_;
    util::Scheduler* scheduler_;
    uint64_t sweepTask_{0};

    mutable std::mutex mutex_;
    std::unique_ptr<db::Database> store_;
    std::list<std::string> index_;  // insertion order, oldest first
    std::unordered_map<std::string, std::list<std::string>::iterator> positions_;
    bool stopped_{false};
};

} // namespace provider
} // namespace chainsync

#endif // CHAINSYNC_PROVIDER_CACHE_H
