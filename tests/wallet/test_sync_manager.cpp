// CHAINSYNC - Sync Manager Tests
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <gtest/gtest.h>

#include "chainsync/core/errors.h"
#include "chainsync/db/memory.h"
#include "chainsync/util/config.h"
#include "chainsync/wallet/state_store.h"
#include "chainsync/wallet/sync_manager.h"
#include "support/fake_wallet.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace chainsync {
namespace wallet {
namespace test {

using chainsync::test::AddressForPath;
using chainsync::test::AddSpend;
using chainsync::test::FakeAccountIterator;
using chainsync::test::FakeAddressStore;
using chainsync::test::FakeKeyManager;
using chainsync::test::FakeProvider;
using chainsync::test::FakeUtxoStore;
using chainsync::test::PaymentTx;

// ============================================================================
// Test Fixture
// ============================================================================

class SyncManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.gapLimit = 3;
        config_.currentBlock = 100;
        config_.minBlockConfirm = 1;
        config_.maxScriptWatch = 2;
        config_.workerThreads = 2;
        state_ = std::make_unique<DatabaseStateStore>(std::make_unique<db::MemoryDatabase>());
        Rebuild();
    }

    void Rebuild() {
        manager_.reset();
        manager_ = std::make_unique<SyncManager>(config_, provider_, keys_, accounts_,
                                                 addresses_, utxos_, *state_);
        manager_->SyncedPath().Connect([this](const PathProgress& p) { progress_.push_back(p); });
        manager_->SyncEnd().Connect([this](Role role) { ended_.push_back(role); });
    }

    static std::string Path(Role role, uint32_t index) {
        return hdpath::MakePath(84, 0, 0, role, index);
    }

    static std::string Ext(uint32_t index) { return AddressForPath(Path(Role::External, index)); }
    static std::string Int(uint32_t index) { return AddressForPath(Path(Role::Internal, index)); }

    static AddressRecord Record(Role role, uint32_t index) {
        std::string path = Path(role, index);
        return AddressRecord{AddressForPath(path), path, "pub:" + path};
    }

    SyncManager::Config config_;
    FakeProvider provider_;
    FakeKeyManager keys_;
    FakeAccountIterator accounts_;
    FakeAddressStore addresses_;
    FakeUtxoStore utxos_;
    std::unique_ptr<DatabaseStateStore> state_;

    std::vector<PathProgress> progress_;
    std::vector<Role> ended_;

    std::unique_ptr<SyncManager> manager_;
};

TEST_F(SyncManagerTest, RejectsZeroGapLimit) {
    config_.gapLimit = 0;
    EXPECT_THROW(Rebuild(), ValidationError);
}

// ============================================================================
// Gap-Limit Scanning Tests
// ============================================================================

TEST_F(SyncManagerTest, StopsBeforeDerivingPastGapLimit) {
    // Activity on the fourth path is never reached
    provider_.SetHistory(Ext(3), {PaymentTx("t3", Ext(3), 1000, 90)});

    manager_->SyncAccount(Role::External);

    std::vector<std::string> expected = {
        Path(Role::External, 0), Path(Role::External, 1), Path(Role::External, 2)};
    EXPECT_EQ(keys_.Derived(), expected);
    EXPECT_EQ(provider_.HistoryQueries(Ext(3)), 0u);

    SyncState state = state_->GetSyncState(SyncOptions{});
    EXPECT_EQ(state.external.path, Path(Role::External, 2));
    EXPECT_EQ(state.external.gap, 3);
    EXPECT_EQ(state.external.gapEnd, 0);

    ASSERT_EQ(progress_.size(), 3u);
    EXPECT_EQ(progress_.back().gapCount, 3);
    EXPECT_EQ(progress_.back().gapLimit, 3);
    EXPECT_FALSE(progress_.back().hasTx);
    ASSERT_EQ(ended_.size(), 1u);
    EXPECT_EQ(ended_[0], Role::External);
    EXPECT_EQ(utxos_.processCount.load(), 1);
    EXPECT_EQ(manager_->GetBalance().confirmed, 0);
}

TEST_F(SyncManagerTest, ActivityResetsGapCount) {
    provider_.SetHistory(Ext(1), {PaymentTx("t1", Ext(1), 5000, 90)});

    manager_->SyncAccount(Role::External);

    // P0 empty, P1 active, then three empty paths
    EXPECT_EQ(keys_.Derived().size(), 5u);
    EXPECT_EQ(accounts_.LastPath(), Path(Role::External, 2));

    SyncState state = state_->GetSyncState(SyncOptions{});
    EXPECT_EQ(state.external.path, Path(Role::External, 4));
    EXPECT_EQ(state.external.gap, 3);
    EXPECT_EQ(state.external.gapEnd, 1);

    ASSERT_GE(progress_.size(), 2u);
    EXPECT_TRUE(progress_[1].hasTx);
    EXPECT_EQ(progress_[1].gapCount, 0);
    EXPECT_EQ(progress_[1].gapEnd, 1);

    EXPECT_EQ(manager_->GetBalance(Ext(1)).confirmed, 5000);
    EXPECT_EQ(manager_->GetBalance().confirmed, 5000);
}

TEST_F(SyncManagerTest, ScanAtGapLimitIsNoop) {
    manager_->SyncAccount(Role::External);
    size_t derived = keys_.Derived().size();

    manager_->SyncAccount(Role::External);
    EXPECT_EQ(keys_.Derived().size(), derived);
    EXPECT_EQ(ended_.size(), 1u);

    manager_->Reset();
    manager_->SyncAccount(Role::External);
    EXPECT_EQ(keys_.Derived().size(), derived * 2);
    EXPECT_EQ(keys_.Derived()[derived], Path(Role::External, 0));
}

TEST_F(SyncManagerTest, ResumesFromPersistedPosition) {
    SyncState state = state_->GetSyncState(SyncOptions{});
    state.external.path = Path(Role::External, 5);
    state.external.gap = 1;
    state_->SetSyncState(state);

    manager_->SyncAccount(Role::External);

    std::vector<std::string> expected = {Path(Role::External, 5), Path(Role::External, 6)};
    EXPECT_EQ(keys_.Derived(), expected);
}

TEST_F(SyncManagerTest, RestartIgnoresPersistedPosition) {
    SyncState state = state_->GetSyncState(SyncOptions{});
    state.external.path = Path(Role::External, 5);
    state.external.gap = 3;
    state_->SetSyncState(state);

    SyncOptions opts;
    opts.restart = true;
    manager_->SyncAccount(Role::External, opts);
    ASSERT_FALSE(keys_.Derived().empty());
    EXPECT_EQ(keys_.Derived()[0], Path(Role::External, 0));
}

TEST_F(SyncManagerTest, InternalRoleKeepsItsOwnState) {
    provider_.SetHistory(Int(0), {PaymentTx("c0", Int(0), 700, 95)});
    manager_->SyncAccount(Role::Internal);

    SyncState state = state_->GetSyncState(SyncOptions{});
    EXPECT_EQ(state.internal.path, Path(Role::Internal, 3));
    EXPECT_EQ(state.internal.gapEnd, 1);
    EXPECT_EQ(state.external.path, Path(Role::External, 0));
    EXPECT_EQ(state.external.gap, 0);
}

// ============================================================================
// Busy Guard and Halt Tests
// ============================================================================

TEST_F(SyncManagerTest, ConcurrentScanRejected) {
    bool rejected = false;
    std::string message;
    manager_->SyncedPath().Connect([&](const PathProgress&) {
        if (rejected) return;
        try {
            manager_->SyncAccount(Role::Internal);
        } catch (const SyncBusyError& e) {
            rejected = true;
            message = e.what();
        }
    });

    EXPECT_FALSE(manager_->IsSyncing());
    manager_->SyncAccount(Role::External);

    EXPECT_TRUE(rejected);
    EXPECT_EQ(message, "already syncing false true");
    EXPECT_FALSE(manager_->IsSyncing());
    EXPECT_EQ(ended_.size(), 1u);
}

TEST_F(SyncManagerTest, HaltedManagerRefusesToScan) {
    manager_->StopSync();
    EXPECT_TRUE(manager_->IsStopped());

    try {
        manager_->SyncAccount(Role::External);
        FAIL() << "expected SyncBusyError";
    } catch (const SyncBusyError& e) {
        EXPECT_STREQ(e.what(), "already syncing true false");
    }
    EXPECT_TRUE(keys_.Derived().empty());

    manager_->ResumeSync();
    EXPECT_NO_THROW(manager_->SyncAccount(Role::External));
}

TEST_F(SyncManagerTest, StopMidScan) {
    manager_->SyncedPath().Connect([this](const PathProgress&) { manager_->StopSync(); });

    manager_->SyncAccount(Role::External);

    EXPECT_EQ(keys_.Derived().size(), 1u);
    EXPECT_EQ(ended_.size(), 1u);
    EXPECT_EQ(utxos_.processCount.load(), 0);
    EXPECT_EQ(state_->GetSyncState(SyncOptions{}).external.path, Path(Role::External, 0));
    EXPECT_TRUE(manager_->IsStopped());
}

// ============================================================================
// Ledger Folding Tests
// ============================================================================

TEST_F(SyncManagerTest, FoldClassifiesByConfirmations) {
    provider_.SetHistory(Ext(0), {
        PaymentTx("conf", Ext(0), 100, 99),
        PaymentTx("pend", Ext(0), 20, 100),
        PaymentTx("pool", Ext(0), 3, 0),
    });

    manager_->SyncAccount(Role::External);

    auto ledger = addresses_.Get(Ext(0));
    ASSERT_TRUE(ledger.has_value());
    EXPECT_EQ(ledger->out.confirmed, 100);
    EXPECT_EQ(ledger->out.pending, 20);
    EXPECT_EQ(ledger->out.mempool, 3);

    Balance balance = manager_->GetBalance(Ext(0));
    EXPECT_EQ(balance.confirmed, 100);
    EXPECT_EQ(balance.pending, 20);
    EXPECT_EQ(balance.mempool, 3);
}

TEST_F(SyncManagerTest, FoldIsIdempotent) {
    auto funding = PaymentTx("t1", Ext(0), 10000, 90, 0, 200);
    auto spend = PaymentTx("t2", "bcrt1qsomeoneelse", 6000, 0);
    AddSpend(spend, Ext(0), 10000, "t1", 0);
    provider_.SetHistory(Ext(0), {funding, spend});

    manager_->SyncAccount(Role::External);

    auto ledger = addresses_.Get(Ext(0));
    ASSERT_TRUE(ledger.has_value());
    EXPECT_EQ(ledger->out.confirmed, 10000);
    EXPECT_EQ(ledger->fee.confirmed, 200);
    EXPECT_EQ(ledger->in.mempool, 10000);
    EXPECT_EQ(ledger->outPoints, std::vector<std::string>{"t1:0"});
    EXPECT_EQ(ledger->inPoints, std::vector<std::string>{"t1:0"});
    EXPECT_EQ(utxos_.AddedCount(), 2u);

    Ledger totals = manager_->GetTotals();

    SyncOptions opts;
    opts.restart = true;
    manager_->SyncAccount(Role::External, opts);

    EXPECT_EQ(*addresses_.Get(Ext(0)), *ledger);
    EXPECT_EQ(manager_->GetTotals(), totals);
    EXPECT_EQ(utxos_.AddedCount(), 2u);

    Balance balance = manager_->GetBalance(Ext(0));
    EXPECT_EQ(balance.confirmed, 10000);
    EXPECT_EQ(balance.mempool, -10000);
}

TEST_F(SyncManagerTest, OutputsOfOtherAddressesIgnored) {
    auto tx = PaymentTx("mix", Ext(0), 400, 90);
    provider::TxOutput foreign;
    foreign.address = "bcrt1qforeign";
    foreign.value = 999;
    foreign.index = 1;
    foreign.txid = "mix";
    tx.outputs.push_back(foreign);
    provider::TxOutput nulldata;
    nulldata.index = 2;
    nulldata.txid = "mix";
    tx.outputs.push_back(nulldata);
    provider_.SetHistory(Ext(0), {tx});

    manager_->SyncAccount(Role::External);
    EXPECT_EQ(manager_->GetBalance(Ext(0)).confirmed, 400);
    EXPECT_EQ(utxos_.AddedCount(), 1u);
}

TEST_F(SyncManagerTest, TotalsPersistedAsTheyChange) {
    provider_.SetHistory(Ext(0), {PaymentTx("t1", Ext(0), 1234, 50)});
    manager_->SyncAccount(Role::External);

    auto persisted = state_->GetTotalBalance();
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->out.confirmed, 1234);
}

TEST_F(SyncManagerTest, UtxosTaggedWithOwner) {
    provider_.SetHistory(Ext(0), {PaymentTx("t1", Ext(0), 1234, 50)});
    manager_->SyncAccount(Role::External);

    auto added = utxos_.Added();
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].second, Direction::Out);
    EXPECT_EQ(added[0].first.path, Path(Role::External, 0));
    EXPECT_EQ(added[0].first.publicKey, "pub:" + Path(Role::External, 0));
    EXPECT_EQ(added[0].first.point.txid, "t1");
}

TEST_F(SyncManagerTest, UnknownAddressBalance) {
    EXPECT_THROW(manager_->GetBalance(std::string("bcrt1qnever")), ValidationError);
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(SyncManagerTest, InitRestoresTotalsAndSubscriptions) {
    Ledger total;
    total.out.confirmed = 777;
    state_->SetTotalBalance(total);
    state_->AddWatchedScriptHashes({{"sh:a", Ext(0), Path(Role::External, 0), Ext(0)}},
                                   Role::External);
    state_->AddWatchedScriptHashes({{"sh:b", Int(0), Path(Role::Internal, 0), Int(0)}},
                                   Role::Internal);

    manager_->Init();

    EXPECT_EQ(manager_->GetTotals(), total);
    EXPECT_EQ(manager_->GetBalance().confirmed, 777);
    std::vector<std::string> subscribed = {Ext(0), Int(0)};
    EXPECT_EQ(provider_.Subscribed(), subscribed);
    EXPECT_EQ(provider_.TransactionSlots(), 1u);
    EXPECT_EQ(addresses_.initCount.load(), 1);
    EXPECT_EQ(utxos_.initCount.load(), 1);

    manager_->Close();
    manager_->Close();
    EXPECT_EQ(provider_.TransactionSlots(), 0u);
    EXPECT_EQ(addresses_.closeCount.load(), 1);
    EXPECT_EQ(utxos_.closeCount.load(), 1);
}

TEST_F(SyncManagerTest, ResetZeroesTotals) {
    provider_.SetHistory(Ext(0), {PaymentTx("t1", Ext(0), 1234, 50)});
    manager_->SyncAccount(Role::External);
    manager_->StopSync();

    manager_->Reset();

    EXPECT_EQ(manager_->GetTotals(), Ledger{});
    EXPECT_EQ(*state_->GetTotalBalance(), Ledger{});
    EXPECT_FALSE(manager_->IsStopped());
    EXPECT_EQ(state_->GetSyncState(SyncOptions{}).external.path, Path(Role::External, 0));
}

// ============================================================================
// Watch Pool Tests
// ============================================================================

TEST_F(SyncManagerTest, WatchPoolEvictsOldest) {
    manager_->WatchAddress("sh:0", Record(Role::External, 0), Role::External);
    manager_->WatchAddress("sh:1", Record(Role::External, 1), Role::External);
    manager_->WatchAddress("sh:2", Record(Role::External, 2), Role::External);

    auto list = state_->GetWatchedScriptHashes(Role::External);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].scriptHash, "sh:1");
    EXPECT_EQ(list[1].scriptHash, "sh:2");
    EXPECT_EQ(list[1].handle, Ext(2));
    EXPECT_EQ(list[1].path, Path(Role::External, 2));

    std::vector<std::string> unsubscribed = {Ext(0)};
    EXPECT_EQ(provider_.Unsubscribed(), unsubscribed);
    EXPECT_EQ(provider_.Subscribed().size(), 3u);
}

TEST_F(SyncManagerTest, WatchSameScriptHashTwice) {
    manager_->WatchAddress("sh:0", Record(Role::External, 0), Role::External);
    manager_->WatchAddress("sh:0", Record(Role::External, 0), Role::External);

    EXPECT_EQ(state_->GetWatchedScriptHashes(Role::External).size(), 1u);
    EXPECT_EQ(provider_.Subscribed().size(), 1u);
}

TEST_F(SyncManagerTest, WatchFailureLeavesStateUntouched) {
    manager_->WatchAddress("sh:0", Record(Role::Internal, 0), Role::Internal);
    provider_.FailSubscriptions(true);

    EXPECT_THROW(manager_->WatchAddress("sh:1", Record(Role::Internal, 1), Role::Internal),
                 SubscriptionError);

    auto list = state_->GetWatchedScriptHashes(Role::Internal);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].scriptHash, "sh:0");
    EXPECT_TRUE(provider_.Unsubscribed().empty());
}

// ============================================================================
// Reconciliation Tests
// ============================================================================

TEST_F(SyncManagerTest, TransactionEventReconcilesWatchedAddresses) {
    manager_->Init();
    manager_->WatchAddress("sh:e0", Record(Role::External, 0), Role::External);
    manager_->WatchAddress("sh:e1", Record(Role::External, 1), Role::External);
    manager_->WatchAddress("sh:i0", Record(Role::Internal, 0), Role::Internal);

    provider_.SetHistory(Ext(0), {PaymentTx("p0", Ext(0), 300, 0)});
    provider_.SetHistory(Ext(1), {PaymentTx("p1", Ext(1), 200, 99)});
    provider_.SetHistory(Int(0), {PaymentTx("p2", Int(0), 100, 99)});

    int notified = 0;
    manager_->NewTransaction().Connect([&notified]() { ++notified; });

    provider::TransactionEvent event;
    event.decoded["txid"] = "p0";
    event.matchedAddress = Ext(0);
    provider_.EmitTransaction(event);

    EXPECT_EQ(notified, 1);
    EXPECT_EQ(provider_.HistoryQueries(Ext(0)), 1u);
    EXPECT_EQ(provider_.HistoryQueries(Ext(1)), 1u);
    EXPECT_EQ(provider_.HistoryQueries(Int(0)), 1u);

    EXPECT_EQ(manager_->GetBalance(Ext(0)).mempool, 300);
    EXPECT_EQ(manager_->GetBalance(Ext(1)).confirmed, 200);
    EXPECT_EQ(manager_->GetBalance(Int(0)).confirmed, 100);
    EXPECT_EQ(manager_->GetBalance().confirmed, 300);

    // Change addresses are dropped after one use
    EXPECT_TRUE(state_->GetWatchedScriptHashes(Role::Internal).empty());
    EXPECT_EQ(state_->GetWatchedScriptHashes(Role::External).size(), 2u);
    auto unsubscribed = provider_.Unsubscribed();
    EXPECT_NE(std::find(unsubscribed.begin(), unsubscribed.end(), Int(0)), unsubscribed.end());
}

TEST_F(SyncManagerTest, RepeatedEventsDoNotDoubleCount) {
    manager_->Init();
    manager_->WatchAddress("sh:e0", Record(Role::External, 0), Role::External);
    provider_.SetHistory(Ext(0), {PaymentTx("p0", Ext(0), 300, 99)});

    provider::TransactionEvent event;
    event.matchedAddress = Ext(0);
    provider_.EmitTransaction(event);
    provider_.EmitTransaction(event);

    EXPECT_EQ(provider_.HistoryQueries(Ext(0)), 2u);
    EXPECT_EQ(manager_->GetBalance(Ext(0)).confirmed, 300);
    EXPECT_EQ(manager_->GetTotals().out.confirmed, 300);
}

TEST_F(SyncManagerTest, EventDuringWatchKeepsPoolConsistent) {
    manager_->Init();
    manager_->WatchAddress("sh:i0", Record(Role::Internal, 0), Role::Internal);

    // A transaction event lands on another thread while the next change
    // address is being subscribed
    std::thread delivery;
    std::promise<void> delivered;
    std::future<void> deliveredFuture = delivered.get_future();
    provider_.OnSubscribe([&](const std::string&) {
        delivery = std::thread([&]() {
            provider::TransactionEvent event;
            event.matchedAddress = Int(0);
            provider_.EmitTransaction(event);
            delivered.set_value();
        });
        deliveredFuture.wait_for(std::chrono::milliseconds(200));
    });

    manager_->WatchAddress("sh:i1", Record(Role::Internal, 1), Role::Internal);
    provider_.OnSubscribe(nullptr);
    delivery.join();

    // Every persisted entry must still be subscribed at the provider
    auto unsubscribed = provider_.Unsubscribed();
    for (const auto& entry : state_->GetWatchedScriptHashes(Role::Internal)) {
        EXPECT_EQ(std::count(unsubscribed.begin(), unsubscribed.end(), entry.handle), 0)
            << entry.address;
    }
    EXPECT_TRUE(state_->GetWatchedScriptHashes(Role::Internal).empty());
    EXPECT_EQ(std::count(unsubscribed.begin(), unsubscribed.end(), Int(1)), 1);
}

TEST_F(SyncManagerTest, ConcurrentFoldsCountOnce) {
    manager_->Init();
    manager_->WatchAddress("sh:e0", Record(Role::External, 0), Role::External);

    auto funding = PaymentTx("t1", Ext(0), 10000, 90, 0, 200);
    auto spend = PaymentTx("t2", "bcrt1qsomeoneelse", 6000, 99);
    AddSpend(spend, Ext(0), 10000, "t1", 0);
    provider_.SetHistory(Ext(0), {funding, spend});

    provider::TransactionEvent event;
    event.matchedAddress = Ext(0);

    std::promise<void> go;
    std::shared_future<void> start = go.get_future().share();
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, start]() {
            start.wait();
            for (int j = 0; j < 5; ++j) {
                provider_.EmitTransaction(event);
            }
        });
    }
    threads.emplace_back([&, start]() {
        start.wait();
        manager_->SyncAccount(Role::External);
    });

    go.set_value();
    for (auto& t : threads) {
        t.join();
    }

    Ledger totals = manager_->GetTotals();
    EXPECT_EQ(totals.out.confirmed, 10000);
    EXPECT_EQ(totals.in.confirmed, 10000);
    EXPECT_EQ(utxos_.AddedCount(), 2u);

    auto ledger = addresses_.Get(Ext(0));
    ASSERT_TRUE(ledger.has_value());
    EXPECT_EQ(ledger->fee.confirmed, 200);
    EXPECT_EQ(ledger->outPoints, std::vector<std::string>{"t1:0"});
    EXPECT_EQ(ledger->inPoints, std::vector<std::string>{"t1:0"});
}

TEST_F(SyncManagerTest, EventsIgnoredAfterClose) {
    manager_->Init();
    manager_->WatchAddress("sh:e0", Record(Role::External, 0), Role::External);
    manager_->Close();

    provider::TransactionEvent event;
    event.matchedAddress = Ext(0);
    provider_.EmitTransaction(event);
    EXPECT_EQ(provider_.HistoryQueries(Ext(0)), 0u);
}

// ============================================================================
// Query Tests
// ============================================================================

TEST_F(SyncManagerTest, UpdateBlock) {
    EXPECT_EQ(manager_->GetCurrentBlock(), 100);
    EXPECT_THROW(manager_->UpdateBlock(0), ValidationError);
    EXPECT_THROW(manager_->UpdateBlock(-5), ValidationError);
    EXPECT_EQ(manager_->GetCurrentBlock(), 100);

    manager_->UpdateBlock(150);
    EXPECT_EQ(manager_->GetCurrentBlock(), 150);
}

TEST_F(SyncManagerTest, BlockHeightDrivesConfirmation) {
    provider_.SetHistory(Ext(0), {PaymentTx("t1", Ext(0), 50, 120)});
    manager_->UpdateBlock(120);
    manager_->SyncAccount(Role::External);
    EXPECT_EQ(manager_->GetBalance(Ext(0)).pending, 50);
    EXPECT_EQ(manager_->GetBalance(Ext(0)).confirmed, 0);
}

TEST_F(SyncManagerTest, UtxoForAmountUnits) {
    manager_->UtxoForAmount(AmountValue{0.5, "main"}, "largest");
    EXPECT_EQ(utxos_.LastAmount(), 50000000);
    EXPECT_EQ(utxos_.LastStrategy(), "largest");

    manager_->UtxoForAmount(AmountValue{1234, "base"}, "smallest");
    EXPECT_EQ(utxos_.LastAmount(), 1234);

    EXPECT_THROW(manager_->UtxoForAmount(AmountValue{1, "sat"}, "largest"), ValidationError);
}

TEST_F(SyncManagerTest, DelegatesToStores) {
    provider_.SetHistory(Ext(0), {PaymentTx("t1", Ext(0), 1234, 50)});
    manager_->SyncAccount(Role::External);

    std::vector<std::string> txids;
    manager_->GetTransactions([&txids](const provider::DecoratedTransaction& tx) {
        txids.push_back(tx.txid);
    });
    EXPECT_EQ(txids, std::vector<std::string>{"t1"});

    auto utxos = manager_->UtxoForAmount(AmountValue{1000, "base"}, "largest");
    ASSERT_EQ(utxos.size(), 1u);
    EXPECT_EQ(utxos[0].point.value, 1234);

    manager_->UnlockUtxo("pending-spend");
    EXPECT_EQ(utxos_.Unlocked(), std::vector<std::string>{"pending-spend"});
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(SyncConfigTest, FromSettings) {
    util::ConfigManager settings;
    ASSERT_TRUE(settings.ParseString("gaplimit=50\nminconfirmations=6\n"
                                     "maxscriptwatch=25\nsyncthreads=2\n").success);

    auto config = SyncConfigFromSettings(settings);
    EXPECT_EQ(config.gapLimit, 50u);
    EXPECT_EQ(config.minBlockConfirm, 6);
    EXPECT_EQ(config.maxScriptWatch, 25u);
    EXPECT_EQ(config.workerThreads, 2u);
}

TEST(SyncConfigTest, DefaultsAndRanges) {
    util::ConfigManager settings;
    auto config = SyncConfigFromSettings(settings);
    EXPECT_EQ(config.gapLimit, 20u);
    EXPECT_EQ(config.minBlockConfirm, 1);
    EXPECT_EQ(config.maxScriptWatch, 10u);

    settings.Set("gaplimit", "0");
    EXPECT_THROW(SyncConfigFromSettings(settings), ValidationError);
}

} // namespace test
} // namespace wallet
} // namespace chainsync
