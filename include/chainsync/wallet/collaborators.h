// CHAINSYNC - Sync Engine Collaborators
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Interfaces the sync engine consumes. Key derivation, the address book and
// the UTXO set live outside this library; the state store has a database
// implementation in state_store.h.

#ifndef CHAINSYNC_WALLET_COLLABORATORS_H
#define CHAINSYNC_WALLET_COLLABORATORS_H

#include <chainsync/core/types.h>
#include <chainsync/provider/transaction.h>
#include <chainsync/wallet/balance.h>
#include <chainsync/wallet/hd_path.h>

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chainsync {
namespace wallet {

// ============================================================================
// Records
// ============================================================================

/// Address derived from a path
struct AddressRecord {
    std::string address;
    std::string path;
    std::string publicKey;
};

/// An address in a role's watch pool
struct WatchedScriptHash {
    std::string scriptHash;
    std::string address;
    std::string path;
    std::string handle;  // returned by ChainProvider::SubscribeToAddress

    bool operator==(const WatchedScriptHash& other) const {
        return scriptHash == other.scriptHash && address == other.address &&
               path == other.path && handle == other.handle;
    }
};

/// Scan position of one role
struct RoleSyncState {
    std::string path;    // last processed path
    int64_t gap{0};      // consecutive paths without history
    int64_t gapEnd{0};   // paths with history found in the last run
};

struct SyncState {
    RoleSyncState external;
    RoleSyncState internal;

    RoleSyncState& ForRole(Role role) { return role == Role::External ? external : internal; }
    const RoleSyncState& ForRole(Role role) const {
        return role == Role::External ? external : internal;
    }
};

struct SyncOptions {
    bool restart{false};  // ignore persisted positions
};

/// An output or a resolved input tagged with the address that owns it
struct Utxo {
    provider::TxInput point;
    std::string publicKey;
    std::string path;
};

// ============================================================================
// Key Derivation
// ============================================================================

class KeyManager {
public:
    virtual ~KeyManager() = default;

    /// Derive the script hash and address record of a path
    virtual std::pair<std::string, AddressRecord> PathToScriptHash(const std::string& path,
                                                                   AddressType type) = 0;
};

class HdAccountIterator {
public:
    using HaltFn = std::function<void()>;
    using PathVisitor = std::function<void(const std::string& path, const HaltFn& halt)>;

    virtual ~HdAccountIterator() = default;

    /// Visit successive paths of a role from startPath until halt is called
    virtual void EachAccount(Role role, const std::string& startPath,
                             const PathVisitor& visit) = 0;

    /// Record the next unused receiving path
    virtual void UpdateLastPath(const std::string& path) = 0;
};

// ============================================================================
// Stores
// ============================================================================

class AddressStore {
public:
    using TxVisitor = std::function<void(const provider::DecoratedTransaction&)>;

    virtual ~AddressStore() = default;

    virtual void Init() = 0;
    virtual void Close() = 0;

    virtual std::optional<AddressLedger> Get(const std::string& address) = 0;
    virtual void Set(const std::string& address, const AddressLedger& ledger) = 0;
    virtual void NewAddress(const std::string& address) = 0;

    virtual void StoreTxHistory(const provider::TxHistory& history) = 0;
    virtual void GetTransactions(const TxVisitor& fn) = 0;
};

class UtxoStore {
public:
    virtual ~UtxoStore() = default;

    virtual void Init() = 0;
    virtual void Close() = 0;

    virtual void Add(const Utxo& utxo, Direction dir) = 0;

    /// Release outputs locked by an unfinished spend
    virtual void Unlock(const std::string& state) = 0;

    virtual std::vector<Utxo> GetUtxoForAmount(Amount amount, const std::string& strategy) = 0;

    /// Rebuild the spendable set from everything added since the last call
    virtual void Process() = 0;
};

class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::vector<WatchedScriptHash> GetWatchedScriptHashes(Role role) = 0;

    /// Replace a role's watch list
    virtual void AddWatchedScriptHashes(const std::vector<WatchedScriptHash>& list,
                                        Role role) = 0;

    virtual SyncState GetSyncState(const SyncOptions& opts) = 0;
    virtual void SetSyncState(const SyncState& state) = 0;
    virtual void ResetSyncState() = 0;

    virtual std::optional<Ledger> GetTotalBalance() = 0;
    virtual void SetTotalBalance(const Ledger& total) = 0;
};

} // namespace wallet
} // namespace chainsync

#endif // CHAINSYNC_WALLET_COLLABORATORS_H
