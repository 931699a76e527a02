// CHAINSYNC - Wallet Sync Manager Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/wallet/sync_manager.h>
#include <chainsync/core/errors.h>
#include <chainsync/util/config.h>
#include <chainsync/util/logging.h>

#include <cmath>

namespace chainsync {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

util::ThreadPool::Config MakePoolConfig(const SyncManager::Config& config) {
    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = config.workerThreads;
    poolConfig.name = "sync";
    return poolConfig;
}

/// Clears a flag when the scope ends
class FlagReset {
public:
    explicit FlagReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~FlagReset() { flag_.store(false); }

    FlagReset(const FlagReset&) = delete;
    FlagReset& operator=(const FlagReset&) = delete;

private:
    std::atomic<bool>& flag_;
};

provider::TxInput AsUtxo(const provider::TxOutput& out) {
    provider::TxInput utxo;
    static_cast<provider::TxOutput&>(utxo) = out;
    return utxo;
}

std::string BoolStr(bool value) {
    return value ? "true" : "false";
}

} // namespace

SyncManager::SyncManager(const Config& config,
                         provider::ChainProvider& provider,
                         KeyManager& keys,
                         HdAccountIterator& accounts,
                         AddressStore& addresses,
                         UtxoStore& utxos,
                         StateStore& state)
    : config_(config)
    , provider_(provider)
    , keys_(keys)
    , accounts_(accounts)
    , addresses_(addresses)
    , utxos_(utxos)
    , state_(state)
    , pool_(MakePoolConfig(config))
    , currentBlock_(config.currentBlock) {
    if (config_.gapLimit == 0) {
        throw ValidationError("gap limit must be positive");
    }
}

SyncManager::~SyncManager() {
    try {
        Close();
    } catch (const std::exception& e) {
        LOG_ERROR(LogCategory::SYNC) << "Close failed: " << e.what();
    }
    pool_.Shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

void SyncManager::Init() {
    addresses_.Init();
    utxos_.Init();

    if (auto total = state_.GetTotalBalance()) {
        std::lock_guard<std::mutex> lock(ledgerMutex_);
        total_ = *total;
    }

    size_t watched = 0;
    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        for (Role role : {Role::External, Role::Internal}) {
            for (const auto& entry : state_.GetWatchedScriptHashes(role)) {
                provider_.SubscribeToAddress(entry.address);
                ++watched;
            }
        }
    }

    std::lock_guard<std::mutex> lock(eventMutex_);
    closed_ = false;
    if (!txSlot_) {
        txSlot_ = provider_.NewTransactions().Connect(
            [this](const provider::TransactionEvent& event) { OnNewTransaction(event); });
    }

    LOG_INFO(LogCategory::SYNC) << "Sync manager ready, " << watched << " watched addresses";
}

void SyncManager::Reset() {
    {
        std::lock_guard<std::mutex> lock(ledgerMutex_);
        total_ = Ledger{};
        state_.SetTotalBalance(total_);
    }
    ResumeSync();
    state_.ResetSyncState();
    LOG_INFO(LogCategory::SYNC) << "Sync state reset";
}

void SyncManager::Close() {
    {
        std::unique_lock<std::mutex> lock(eventMutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        if (txSlot_) {
            provider_.NewTransactions().Disconnect(*txSlot_);
            txSlot_.reset();
        }
        eventCv_.wait(lock, [this]() { return activeEvents_ == 0; });
    }

    addresses_.Close();
    utxos_.Close();
}

// ============================================================================
// Scanning
// ============================================================================

void SyncManager::SyncAccount(Role role, const SyncOptions& opts) {
    {
        std::lock_guard<std::mutex> lock(syncMutex_);
        if (halt_.load() || syncing_.load()) {
            throw SyncBusyError("already syncing " + BoolStr(halt_.load()) + " " +
                                BoolStr(syncing_.load()));
        }
        syncing_.store(true);
    }
    FlagReset syncingGuard(syncing_);

    SyncState syncState = state_.GetSyncState(opts);
    RoleSyncState& roleState = syncState.ForRole(role);
    const int64_t gapLimit = static_cast<int64_t>(config_.gapLimit);

    int64_t gapCount = roleState.gap;
    int64_t gapEnd = 0;
    if (gapCount >= gapLimit) {
        LOG_DEBUG(LogCategory::SYNC) << RoleToString(role) << " already at gap limit";
        return;
    }

    LOG_INFO(LogCategory::SYNC) << "Scanning " << RoleToString(role) << " from "
                                << roleState.path;

    accounts_.EachAccount(role, roleState.path,
        [&](const std::string& path, const HdAccountIterator::HaltFn& halt) {
            PathResult result = ProcessPath(path, gapEnd, gapCount);
            if (!result.done) {
                halt();
                return;
            }

            // Never hand out an address that already has history
            if (result.hasTx) {
                accounts_.UpdateLastPath(hdpath::BumpIndex(path));
            }

            roleState.path = path;
            roleState.gap = gapCount;
            roleState.gapEnd = gapEnd;
            state_.SetSyncState(syncState);

            LOG_DEBUG(LogCategory::SYNC) << RoleToString(role) << " " << path
                                         << (result.hasTx ? " has history" : " empty")
                                         << " gap " << gapCount << "/" << gapLimit
                                         << " end " << gapEnd;
            syncedPath_.Emit(PathProgress{role, path, result.hasTx, gapCount, gapLimit, gapEnd});
        });

    if (halt_.load()) {
        LOG_INFO(LogCategory::SYNC) << "Scan of " << RoleToString(role) << " halted at "
                                    << roleState.path;
        syncEnd_.Emit(role);
        return;
    }

    utxos_.Process();
    LOG_INFO(LogCategory::SYNC) << "Scan of " << RoleToString(role) << " complete, "
                                << gapEnd << " active addresses";
    syncEnd_.Emit(role);
}

SyncManager::PathResult SyncManager::ProcessPath(const std::string& path,
                                                 int64_t& gapEnd,
                                                 int64_t& gapCount) {
    PathResult result;
    if (halt_.load() || gapCount >= static_cast<int64_t>(config_.gapLimit)) {
        return result;
    }

    auto derived = keys_.PathToScriptHash(path, hdpath::GetAddressType(path));
    const AddressRecord& addr = derived.second;
    LOG_TRACE(LogCategory::SYNC) << path << " -> " << addr.address << " (" << derived.first << ")";

    provider::TxHistory history = provider_.GetAddressHistory(addr.address);
    if (history.empty()) {
        ++gapCount;
    } else {
        ProcessHistory(addr, history);
        ++gapEnd;
        gapCount = 0;
        result.hasTx = true;
    }

    result.done = true;
    return result;
}

// ============================================================================
// Ledger Folding
// ============================================================================

std::mutex& SyncManager::AddressMutex(const std::string& address) {
    std::lock_guard<std::mutex> lock(addressLocksMutex_);
    auto& slot = addressLocks_[address];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

TxState SyncManager::GetTxState(const provider::DecoratedTransaction& tx) const {
    if (tx.height == 0) {
        return TxState::Mempool;
    }
    if (currentBlock_.load() - tx.height >= config_.minBlockConfirm) {
        return TxState::Confirmed;
    }
    return TxState::Pending;
}

void SyncManager::ProcessHistory(const AddressRecord& addr, const provider::TxHistory& history) {
    std::lock_guard<std::mutex> lock(AddressMutex(addr.address));

    if (!addresses_.Get(addr.address)) {
        addresses_.NewAddress(addr.address);
    }
    addresses_.StoreTxHistory(history);

    for (const auto& tx : history) {
        TxState txState = GetTxState(tx);
        for (const auto& out : tx.outputs) {
            ProcessUtxo(AsUtxo(out), Direction::Out, txState, tx.fee, addr);
        }
        for (const auto& in : tx.inputs) {
            ProcessUtxo(in, Direction::In, txState, 0, addr);
        }
    }
}

void SyncManager::ProcessUtxo(const provider::TxInput& utxo, Direction dir, TxState state,
                              Amount fee, const AddressRecord& addr) {
    if (!utxo.address || *utxo.address != addr.address) {
        return;
    }
    auto ledger = addresses_.Get(addr.address);
    if (!ledger) {
        return;
    }

    std::string point = dir == Direction::Out
        ? utxo.txid + ":" + std::to_string(utxo.index)
        : utxo.prevTxid + ":" + std::to_string(utxo.prevIndex);
    if (ledger->HasPoint(dir, point)) {
        return;
    }

    ledger->Bucket(dir).Add(state, utxo.value);
    if (dir == Direction::Out) {
        ledger->fee.Add(state, fee);
    }
    ledger->RecordPoint(dir, point);
    addresses_.Set(addr.address, *ledger);

    utxos_.Add(Utxo{utxo, addr.publicKey, addr.path}, dir);

    {
        std::lock_guard<std::mutex> lock(ledgerMutex_);
        total_.Bucket(dir).Add(state, utxo.value);
        state_.SetTotalBalance(total_);
    }

    LOG_TRACE(LogCategory::LEDGER) << addr.address << " " << DirectionToString(dir) << " "
                                   << TxStateToString(state) << " +" << FormatAmount(utxo.value)
                                   << " " << point;
}

// ============================================================================
// Watched Addresses
// ============================================================================

void SyncManager::WatchAddress(const std::string& scriptHash, const AddressRecord& addr,
                               Role role) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    std::vector<WatchedScriptHash> list = state_.GetWatchedScriptHashes(role);
    for (const auto& entry : list) {
        if (entry.scriptHash == scriptHash) {
            return;
        }
    }

    std::optional<WatchedScriptHash> evicted;
    if (!list.empty() && list.size() >= config_.maxScriptWatch) {
        evicted = list.front();
        list.erase(list.begin());
    }

    std::string handle;
    try {
        handle = provider_.SubscribeToAddress(addr.address);
    } catch (const std::runtime_error& e) {
        throw SubscriptionError(std::string("Failed to subscribe to address ") + e.what());
    }
    if (handle.empty()) {
        throw SubscriptionError("Failed to subscribe to address " + addr.address);
    }

    list.push_back(WatchedScriptHash{scriptHash, addr.address, addr.path, handle});
    state_.AddWatchedScriptHashes(list, role);

    if (evicted) {
        provider_.UnsubscribeFromAddress(evicted->handle);
        LOG_DEBUG(LogCategory::SYNC) << "Evicted " << evicted->address << " from "
                                     << RoleToString(role) << " watch pool";
    }
}

void SyncManager::OnNewTransaction(const provider::TransactionEvent& event) {
    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        if (closed_) {
            return;
        }
        ++activeEvents_;
    }

    try {
        UpdateScriptHashBalance(event.matchedAddress);
        newTransaction_.Emit();
    } catch (const std::exception& e) {
        LOG_ERROR(LogCategory::SYNC) << "Reconciliation failed: " << e.what();
        syncErrors_.Emit(e.what());
    }

    std::lock_guard<std::mutex> lock(eventMutex_);
    --activeEvents_;
    eventCv_.notify_all();
}

void SyncManager::FoldWatched(const std::vector<WatchedScriptHash>& list,
                              const std::string& skipHandle) {
    util::TaskGroup group(pool_);
    for (const auto& entry : list) {
        if (entry.handle == skipHandle) {
            continue;
        }
        group.Add([this, entry]() {
            provider::TxHistory history = provider_.GetAddressHistory(entry.address);
            ProcessHistory(AddressRecord{entry.address, entry.path, ""}, history);
        });
    }
    group.Wait();
}

void SyncManager::UpdateScriptHashBalance(const std::string& changeHash) {
    std::vector<WatchedScriptHash> inList = state_.GetWatchedScriptHashes(Role::Internal);
    std::vector<WatchedScriptHash> extList = state_.GetWatchedScriptHashes(Role::External);

    FoldWatched(extList, changeHash);
    FoldWatched(inList, changeHash);

    // The triggering address is folded last so its history reflects the event
    for (const auto* list : {&extList, &inList}) {
        for (const auto& entry : *list) {
            if (entry.handle == changeHash) {
                provider::TxHistory history = provider_.GetAddressHistory(entry.address);
                ProcessHistory(AddressRecord{entry.address, entry.path, ""}, history);
            }
        }
    }

    // Change addresses are single use. The pool is re-read under the lock
    // since a watch may have landed while the histories were folded.
    size_t released = 0;
    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        std::vector<WatchedScriptHash> current = state_.GetWatchedScriptHashes(Role::Internal);
        state_.AddWatchedScriptHashes({}, Role::Internal);
        for (const auto& entry : current) {
            provider_.UnsubscribeFromAddress(entry.handle);
        }
        released = current.size();
    }

    LOG_DEBUG(LogCategory::SYNC) << "Reconciled " << extList.size() << " external and "
                                 << inList.size() << " internal addresses, released "
                                 << released;
}

// ============================================================================
// Queries
// ============================================================================

Balance SyncManager::GetBalance(const std::optional<std::string>& address) {
    if (!address) {
        std::lock_guard<std::mutex> lock(ledgerMutex_);
        return DeriveBalance(total_);
    }

    auto ledger = addresses_.Get(*address);
    if (!ledger) {
        throw ValidationError("Address not valid or not processed for balance " + *address);
    }
    return DeriveBalance(*ledger);
}

Ledger SyncManager::GetTotals() const {
    std::lock_guard<std::mutex> lock(ledgerMutex_);
    return total_;
}

void SyncManager::UpdateBlock(Height height) {
    if (height <= 0) {
        throw ValidationError("invalid block height");
    }
    currentBlock_.store(height);
}

void SyncManager::UnlockUtxo(const std::string& state) {
    utxos_.Unlock(state);
}

std::vector<Utxo> SyncManager::UtxoForAmount(const AmountValue& value,
                                             const std::string& strategy) {
    Amount amount;
    if (value.unit == "main") {
        amount = AmountFromValue(value.amount);
    } else if (value.unit == "base") {
        amount = static_cast<Amount>(std::llround(value.amount));
    } else {
        throw ValidationError("invalid amount unit: " + value.unit);
    }
    return utxos_.GetUtxoForAmount(amount, strategy);
}

void SyncManager::GetTransactions(const AddressStore::TxVisitor& fn) {
    addresses_.GetTransactions(fn);
}

// ============================================================================
// Configuration
// ============================================================================

SyncManager::Config SyncConfigFromSettings(const util::ConfigManager& settings) {
    namespace keys = util::ConfigKeys;
    SyncManager::Config config;

    config.gapLimit = static_cast<size_t>(
        settings.GetIntInRange(keys::GAPLIMIT, static_cast<int64_t>(config.gapLimit), 1, 100000));
    config.minBlockConfirm =
        settings.GetIntInRange(keys::MINCONFIRMATIONS, config.minBlockConfirm, 0, 1000000);
    config.maxScriptWatch = static_cast<size_t>(
        settings.GetIntInRange(keys::MAXSCRIPTWATCH,
                               static_cast<int64_t>(config.maxScriptWatch), 1, 100000));
    config.workerThreads = static_cast<size_t>(
        settings.GetIntInRange(keys::SYNCTHREADS,
                               static_cast<int64_t>(config.workerThreads), 1, 256));
    return config;
}

} // namespace wallet
} // namespace chainsync
