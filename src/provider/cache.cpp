// CHAINSYNC - Response Cache Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/provider/cache.h>
#include <chainsync/db/memory.h>
#include <chainsync/util/logging.h>
#include <chainsync/util/threadpool.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace chainsync {
namespace provider {

namespace {

std::string EntryKey(const std::string& key) {
    return db::MakeKey(db::prefix::CACHE_ENTRY, key);
}

} // namespace

ResponseCache::ResponseCache() : ResponseCache(Config{}) {}

ResponseCache::ResponseCache(const Config& config,
                             util::Scheduler* scheduler,
                             std::unique_ptr<db::Database> store)
    : config_(config)
    , scheduler_(scheduler)
    , store_(store ? std::move(store) : std::make_unique<db::MemoryDatabase>()) {
    LoadIndex();
    if (scheduler_ && config_.sweepInterval.count() > 0) {
        sweepTask_ = scheduler_->SchedulePeriodic(config_.sweepInterval, config_.sweepInterval,
                                                  [this]() { Sweep(); });
    }
}

ResponseCache::~ResponseCache() {
    Stop();
}

void ResponseCache::LoadIndex() {
    const std::string prefix = db::MakeKey(db::prefix::CACHE_ENTRY);
    const int64_t now = util::GetTimeMillis();
    std::vector<std::pair<int64_t, std::string>> live;
    std::vector<std::string> stale;

    {
        auto it = store_->NewIterator();
        for (it->Seek(prefix); it->Valid(); it->Next()) {
            if (!it->key().starts_with(prefix)) {
                break;
            }
            std::string key = it->key().ToString().substr(prefix.size());
            auto entry = rpc::JSONValue::TryParse(it->value().ToString());
            if (!entry || (*entry)["e"].GetInt() <= now) {
                stale.push_back(key);
            } else {
                live.emplace_back((*entry)["e"].GetInt(), key);
            }
        }
        if (!it->status().ok()) {
            throw std::runtime_error("cache load failed: " + it->status().ToString());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::sort(live.begin(), live.end());
    for (const auto& [expiry, key] : live) {
        index_.push_back(key);
        positions_[key] = std::prev(index_.end());
    }
    for (const auto& key : stale) {
        EraseLocked(key);
    }
    while (index_.size() > config_.maxSize) {
        EraseLocked(index_.front());
    }

    if (!live.empty() || !stale.empty()) {
        LOG_INFO(util::LogCategory::CACHE) << "Loaded " << index_.size() << " cached entries, dropped "
                                           << (live.size() - index_.size() + stale.size());
    }
}

void ResponseCache::CheckRunning() const {
    if (stopped_) {
        throw std::runtime_error("cache stopped");
    }
}

void ResponseCache::EraseLocked(const std::string& key) {
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        index_.erase(it->second);
        positions_.erase(it);
    }
    db::Status s = store_->Delete(EntryKey(key));
    if (!s.ok()) {
        LOG_WARN(util::LogCategory::CACHE) << "Failed to delete " << key << ": " << s.ToString();
    }
}

void ResponseCache::Set(const std::string& key, const rpc::JSONValue& value,
                        std::optional<int64_t> expiryMillis) {
    int64_t expiry;
    if (expiryMillis) {
        expiry = *expiryMillis;
    } else if (value.IsObject() && value["expiry"].IsNumber()) {
        expiry = value["expiry"].GetInt();
    } else {
        expiry = util::GetTimeMillis() + config_.expiry.count();
    }

    rpc::JSONValue entry;
    entry["v"] = value;
    entry["e"] = expiry;

    std::lock_guard<std::mutex> lock(mutex_);
    CheckRunning();

    auto existing = positions_.find(key);
    if (existing != positions_.end()) {
        // Overwrite moves the key to the newest position
        index_.erase(existing->second);
        positions_.erase(existing);
    } else if (!index_.empty() && index_.size() >= config_.maxSize) {
        std::string oldest = index_.front();
        EraseLocked(oldest);
        LOG_DEBUG(util::LogCategory::CACHE) << "Evicted " << oldest;
    }

    db::Status s = store_->Put(EntryKey(key), entry.ToJSON());
    if (!s.ok()) {
        throw std::runtime_error("cache write failed: " + s.ToString());
    }
    index_.push_back(key);
    positions_[key] = std::prev(index_.end());
}

std::optional<rpc::JSONValue> ResponseCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    CheckRunning();

    std::string raw;
    db::Status s = store_->Get(EntryKey(key), &raw);
    if (!s.ok()) {
        return std::nullopt;
    }

    auto entry = rpc::JSONValue::TryParse(raw);
    if (!entry) {
        LOG_WARN(util::LogCategory::CACHE) << "Dropping unreadable entry " << key;
        EraseLocked(key);
        return std::nullopt;
    }

    if ((*entry)["e"].GetInt() <= util::GetTimeMillis()) {
        EraseLocked(key);
        return std::nullopt;
    }

    return (*entry)["v"];
}

size_t ResponseCache::Sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return 0;
    }

    int64_t now = util::GetTimeMillis();
    std::vector<std::string> expired;

    for (const auto& key : index_) {
        std::string raw;
        if (!store_->Get(EntryKey(key), &raw).ok()) {
            expired.push_back(key);
            continue;
        }
        auto entry = rpc::JSONValue::TryParse(raw);
        if (!entry || (*entry)["e"].GetInt() <= now) {
            expired.push_back(key);
        }
    }

    for (const auto& key : expired) {
        EraseLocked(key);
    }

    if (!expired.empty()) {
        LOG_DEBUG(util::LogCategory::CACHE) << "Sweep removed " << expired.size() << " entries";
    }
    return expired.size();
}

void ResponseCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    CheckRunning();

    db::WriteBatch batch;
    for (const auto& key : index_) {
        batch.Delete(EntryKey(key));
    }
    db::Status s = store_->Write(&batch);
    if (!s.ok()) {
        throw std::runtime_error("cache clear failed: " + s.ToString());
    }
    index_.clear();
    positions_.clear();
}

void ResponseCache::Stop() {
    uint64_t task = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        task = sweepTask_;
        sweepTask_ = 0;
        index_.clear();
        positions_.clear();
        store_.reset();
    }

    if (scheduler_ && task != 0) {
        scheduler_->Cancel(task);
    }
}

size_t ResponseCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

bool ResponseCache::IsStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

} // namespace provider
} // namespace chainsync
