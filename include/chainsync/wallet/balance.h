// CHAINSYNC - Wallet Balances and Ledger
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Three-bucket balances (confirmed / pending / mempool) and the in/out/fee
// ledger kept per address and in aggregate.

#ifndef CHAINSYNC_WALLET_BALANCE_H
#define CHAINSYNC_WALLET_BALANCE_H

#include <chainsync/core/types.h>
#include <chainsync/rpc/json.h>

#include <string>
#include <vector>

namespace chainsync {
namespace wallet {

/// Confirmation state of a transaction relative to the current block
enum class TxState {
    Confirmed,
    Pending,
    Mempool
};

const char* TxStateToString(TxState state);

/// Out: value paid to the address. In: value spent from it.
enum class Direction {
    In,
    Out
};

const char* DirectionToString(Direction dir);

// ============================================================================
// Balance
// ============================================================================

struct Balance {
    Amount confirmed{0};
    Amount pending{0};
    Amount mempool{0};

    Amount Get(TxState state) const;
    void Add(TxState state, Amount value);

    bool operator==(const Balance& other) const {
        return confirmed == other.confirmed && pending == other.pending &&
               mempool == other.mempool;
    }
    bool operator!=(const Balance& other) const { return !(*this == other); }

    rpc::JSONValue ToJSON() const;
    static Balance FromJSON(const rpc::JSONValue& json);
};

// ============================================================================
// Ledger
// ============================================================================

/// In/out/fee buckets; the aggregate over every processed address
struct Ledger {
    Balance in;
    Balance out;
    Balance fee;

    Balance& Bucket(Direction dir) { return dir == Direction::In ? in : out; }
    const Balance& Bucket(Direction dir) const { return dir == Direction::In ? in : out; }

    bool operator==(const Ledger& other) const {
        return in == other.in && out == other.out && fee == other.fee;
    }
    bool operator!=(const Ledger& other) const { return !(*this == other); }

    rpc::JSONValue ToJSON() const;
    static Ledger FromJSON(const rpc::JSONValue& json);
};

/// Ledger of one address plus the points already folded into it
struct AddressLedger : Ledger {
    std::vector<std::string> inPoints;   // "prevTxid:prevIndex"
    std::vector<std::string> outPoints;  // "txid:index"

    bool HasPoint(Direction dir, const std::string& point) const;
    void RecordPoint(Direction dir, const std::string& point);

    bool operator==(const AddressLedger& other) const {
        return Ledger::operator==(other) && inPoints == other.inPoints &&
               outPoints == other.outPoints;
    }

    rpc::JSONValue ToJSON() const;
    static AddressLedger FromJSON(const rpc::JSONValue& json);
};

/**
 * Spendable view of a ledger:
 *   mempool   = out.mempool - in.mempool
 *   confirmed = out.confirmed - in.confirmed
 *   pending   = |in.pending - out.pending|
 */
Balance DeriveBalance(const Ledger& ledger);

} // namespace wallet
} // namespace chainsync

#endif // CHAINSYNC_WALLET_BALANCE_H
