// CHAINSYNC - Database State Store Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/wallet/state_store.h>
#include <chainsync/util/logging.h>

#include <stdexcept>

namespace chainsync {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

std::string WatchedKey(Role role) {
    return db::MakeKey(db::prefix::WATCHED, RoleToString(role));
}

rpc::JSONValue RoleStateToJSON(const RoleSyncState& state) {
    rpc::JSONValue json;
    json["path"] = state.path;
    json["gap"] = state.gap;
    json["gapEnd"] = state.gapEnd;
    return json;
}

RoleSyncState RoleStateFromJSON(const rpc::JSONValue& json, const std::string& defaultPath) {
    RoleSyncState state;
    state.path = json["path"].GetString(defaultPath);
    state.gap = json["gap"].GetInt();
    state.gapEnd = json["gapEnd"].GetInt();
    return state;
}

} // namespace

DatabaseStateStore::DatabaseStateStore(std::unique_ptr<db::Database> db)
    : DatabaseStateStore(std::move(db), Config{}) {}

DatabaseStateStore::DatabaseStateStore(std::unique_ptr<db::Database> db, const Config& config)
    : config_(config)
    , db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("DatabaseStateStore requires a database");
    }
}

std::optional<rpc::JSONValue> DatabaseStateStore::ReadJSON(const std::string& key) {
    std::string raw;
    db::Status s = db_->Get(key, &raw);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    if (!s.ok()) {
        throw std::runtime_error("state read failed: " + s.ToString());
    }
    auto json = rpc::JSONValue::TryParse(raw);
    if (!json) {
        LOG_WARN(LogCategory::DB) << "Ignoring unreadable state record " << key;
    }
    return json;
}

void DatabaseStateStore::WriteJSON(const std::string& key, const rpc::JSONValue& value) {
    db::WriteOptions options;
    options.sync = true;
    db::Status s = db_->Put(options, key, value.ToJSON());
    if (!s.ok()) {
        throw std::runtime_error("state write failed: " + s.ToString());
    }
}

// ============================================================================
// Watch Lists
// ============================================================================

std::vector<WatchedScriptHash> DatabaseStateStore::GetWatchedScriptHashes(Role role) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WatchedScriptHash> result;

    auto json = ReadJSON(WatchedKey(role));
    if (!json) {
        return result;
    }
    for (const auto& row : json->GetArray()) {
        WatchedScriptHash entry;
        entry.scriptHash = row[0].GetString();
        entry.address = row[1].GetString();
        entry.path = row[2].GetString();
        entry.handle = row[3].GetString();
        result.push_back(std::move(entry));
    }
    return result;
}

void DatabaseStateStore::AddWatchedScriptHashes(const std::vector<WatchedScriptHash>& list,
                                                Role role) {
    rpc::JSONValue::Array rows;
    for (const auto& entry : list) {
        rows.emplace_back(rpc::JSONValue::Array{
            rpc::JSONValue(entry.scriptHash),
            rpc::JSONValue(entry.address),
            rpc::JSONValue(entry.path),
            rpc::JSONValue(entry.handle)
        });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    WriteJSON(WatchedKey(role), rpc::JSONValue(std::move(rows)));
}

// ============================================================================
// Sync State
// ============================================================================

SyncState DatabaseStateStore::InitialState() const {
    SyncState state;
    state.external.path = config_.externalStartPath;
    state.internal.path = config_.internalStartPath;
    return state;
}

SyncState DatabaseStateStore::GetSyncState(const SyncOptions& opts) {
    if (opts.restart) {
        return InitialState();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto json = ReadJSON(db::MakeKey(db::prefix::SYNC_STATE));
    if (!json) {
        return InitialState();
    }

    SyncState state;
    state.external = RoleStateFromJSON((*json)["external"], config_.externalStartPath);
    state.internal = RoleStateFromJSON((*json)["internal"], config_.internalStartPath);
    return state;
}

void DatabaseStateStore::SetSyncState(const SyncState& state) {
    rpc::JSONValue json;
    json["external"] = RoleStateToJSON(state.external);
    json["internal"] = RoleStateToJSON(state.internal);

    std::lock_guard<std::mutex> lock(mutex_);
    WriteJSON(db::MakeKey(db::prefix::SYNC_STATE), json);
}

void DatabaseStateStore::ResetSyncState() {
    std::lock_guard<std::mutex> lock(mutex_);
    db::Status s = db_->Delete(db::MakeKey(db::prefix::SYNC_STATE));
    if (!s.ok() && !s.IsNotFound()) {
        throw std::runtime_error("state reset failed: " + s.ToString());
    }
}

// ============================================================================
// Totals
// ============================================================================

std::optional<Ledger> DatabaseStateStore::GetTotalBalance() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto json = ReadJSON(db::MakeKey(db::prefix::TOTALS));
    if (!json) {
        return std::nullopt;
    }
    return Ledger::FromJSON(*json);
}

void DatabaseStateStore::SetTotalBalance(const Ledger& total) {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteJSON(db::MakeKey(db::prefix::TOTALS), total.ToJSON());
}

} // namespace wallet
} // namespace chainsync
