// CHAINSYNC - Database State Store
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// StateStore over a key-value database. Records are JSON documents:
//   w<role> -> [[scriptHash, address, path, handle], ...]
//   s       -> {"external":{path,gap,gapEnd}, "internal":{...}}
//   t       -> {"in":{...}, "out":{...}, "fee":{...}}

#ifndef CHAINSYNC_WALLET_STATE_STORE_H
#define CHAINSYNC_WALLET_STATE_STORE_H

#include <chainsync/db/database.h>
#include <chainsync/rpc/json.h>
#include <chainsync/wallet/collaborators.h>

#include <memory>
#include <mutex>
#include <string>

namespace chainsync {
namespace wallet {

class DatabaseStateStore : public StateStore {
public:
    struct Config {
        std::string externalStartPath{"m/84'/0'/0'/0/0"};
        std::string internalStartPath{"m/84'/0'/0'/1/0"};
    };

    explicit DatabaseStateStore(std::unique_ptr<db::Database> db);
    DatabaseStateStore(std::unique_ptr<db::Database> db, const Config& config);

    std::vector<WatchedScriptHash> GetWatchedScriptHashes(Role role) override;
    void AddWatchedScriptHashes(const std::vector<WatchedScriptHash>& list, Role role) override;

    SyncState GetSyncState(const SyncOptions& opts) override;
    void SetSyncState(const SyncState& state) override;
    void ResetSyncState() override;

    std::optional<Ledger> GetTotalBalance() override;
    void SetTotalBalance(const Ledger& total) override;

    const Config& GetConfig() const { return config_; }

private:
    std::optional<rpc::JSONValue> ReadJSON(const std::string& key);
    void WriteJSON(const std::string& key, const rpc::JSONValue& value);
    SyncState InitialState() const;

    Config config_;
    std::mutex mutex_;
    std::unique_ptr<db::Database> db_;
};

} // namespace wallet
} // namespace chainsync

#endif // CHAINSYNC_WALLET_STATE_STORE_H
