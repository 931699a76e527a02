// CHAINSYNC - Wallet Sync Manager
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Gap-limit HD scanning, ledger folding and the watched-address pools.
//
// A scan walks a role's chain from its last persisted path, folding the
// history of every address with activity into the per-address and
// aggregate ledgers, and stops after gapLimit consecutive empty addresses.
// Provider transaction events trigger a re-fold of every watched address.

#ifndef CHAINSYNC_WALLET_SYNC_MANAGER_H
#define CHAINSYNC_WALLET_SYNC_MANAGER_H

#include <chainsync/core/types.h>
#include <chainsync/provider/provider.h>
#include <chainsync/util/signal.h>
#include <chainsync/util/threadpool.h>
#include <chainsync/wallet/balance.h>
#include <chainsync/wallet/collaborators.h>
#include <chainsync/wallet/hd_path.h>

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chainsync {

namespace util {
class ConfigManager;
}

namespace wallet {

/// Emitted after every processed path of a scan
struct PathProgress {
    Role role{Role::External};
    std::string path;
    bool hasTx{false};
    int64_t gapCount{0};
    int64_t gapLimit{0};
    int64_t gapEnd{0};
};

/// Amount in either whole coins ("main") or base units ("base")
struct AmountValue {
    double amount{0};
    std::string unit{"main"};
};

class SyncManager {
public:
    struct Config {
        size_t gapLimit{20};
        Height currentBlock{0};
        int64_t minBlockConfirm{1};   // blocks before a tx counts as confirmed
        size_t maxScriptWatch{10};    // per-role watch pool bound
        size_t workerThreads{4};      // history fetches during reconciliation
    };

    /// Collaborators must outlive the manager
    SyncManager(const Config& config,
                provider::ChainProvider& provider,
                KeyManager& keys,
                HdAccountIterator& accounts,
                AddressStore& addresses,
                UtxoStore& utxos,
                StateStore& state);
    ~SyncManager();

    SyncManager(const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Open the stores, load totals, re-subscribe watched addresses and
    /// start listening for provider transaction events
    void Init();

    /// Zero and persist the totals, resume and forget scan positions
    void Reset();

    void Close();

    // ========================================================================
    // Scanning
    // ========================================================================

    /**
     * Scan a role's chain until gapLimit consecutive paths have no history.
     * Throws SyncBusyError if a scan is running or the manager is halted.
     */
    void SyncAccount(Role role, const SyncOptions& opts = SyncOptions{});

    void StopSync() { halt_.store(true); }
    void ResumeSync() { halt_.store(false); }
    bool IsStopped() const { return halt_.load(); }
    bool IsSyncing() const { return syncing_.load(); }

    /// Add an address to a role's watch pool, evicting the oldest at the bound
    void WatchAddress(const std::string& scriptHash, const AddressRecord& addr, Role role);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Derived balance of one address, or of the whole wallet
    Balance GetBalance(const std::optional<std::string>& address = std::nullopt);

    /// Snapshot of the aggregate ledger
    Ledger GetTotals() const;

    void UpdateBlock(Height height);
    Height GetCurrentBlock() const { return currentBlock_.load(); }

    void UnlockUtxo(const std::string& state);
    std::vector<Utxo> UtxoForAmount(const AmountValue& value, const std::string& strategy);
    void GetTransactions(const AddressStore::TxVisitor& fn);

    const Config& GetConfig() const { return config_; }

    // ========================================================================
    // Notification Channels
    // ========================================================================

    util::Signal<const PathProgress&>& SyncedPath() { return syncedPath_; }
    util::Signal<Role>& SyncEnd() { return syncEnd_; }
    util::Signal<>& NewTransaction() { return newTransaction_; }
    util::Signal<const std::string&>& SyncErrors() { return syncErrors_; }

private:
    struct PathResult {
        bool done{false};
        bool hasTx{false};
    };

    PathResult ProcessPath(const std::string& path, int64_t& gapEnd, int64_t& gapCount);
    void ProcessHistory(const AddressRecord& addr, const provider::TxHistory& history);
    void ProcessUtxo(const provider::TxInput& utxo, Direction dir, TxState state,
                     Amount fee, const AddressRecord& addr);
    TxState GetTxState(const provider::DecoratedTransaction& tx) const;

    void OnNewTransaction(const provider::TransactionEvent& event);
    void UpdateScriptHashBalance(const std::string& changeHash);
    void FoldWatched(const std::vector<WatchedScriptHash>& list, const std::string& skipHandle);

    std::mutex& AddressMutex(const std::string& address);

    Config config_;
    provider::ChainProvider& provider_;
    KeyManager& keys_;
    HdAccountIterator& accounts_;
    AddressStore& addresses_;
    UtxoStore& utxos_;
    StateStore& state_;

    util::ThreadPool pool_;

    std::mutex syncMutex_;
    std::atomic<bool> halt_{false};
    std::atomic<bool> syncing_{false};
    std::atomic<Height> currentBlock_;

    mutable std::mutex ledgerMutex_;
    Ledger total_;

    // Held across read, subscribe and persist of either watch pool
    std::mutex watchMutex_;

    std::mutex addressLocksMutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> addressLocks_;

    // Provider event slot and in-flight reconciliations
    std::mutex eventMutex_;
    std::condition_variable eventCv_;
    std::optional<util::SlotId> txSlot_;
    int activeEvents_{0};
    bool closed_{false};

    util::Signal<const PathProgress&> syncedPath_;
    util::Signal<Role> syncEnd_;
    util::Signal<> newTransaction_;
    util::Signal<const std::string&> syncErrors_;
};

/// Map gaplimit/minconfirmations/maxscriptwatch/syncthreads onto a Config
SyncManager::Config SyncConfigFromSettings(const util::ConfigManager& settings);

} // namespace wallet
} // namespace chainsync

#endif // CHAINSYNC_WALLET_SYNC_MANAGER_H
