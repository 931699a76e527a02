// CHAINSYNC - Decorated Transactions and Provider Events
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Typed views of node data handed from the provider to the sync engine.

#ifndef CHAINSYNC_PROVIDER_TRANSACTION_H
#define CHAINSYNC_PROVIDER_TRANSACTION_H

#include <chainsync/core/types.h>
#include <chainsync/rpc/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chainsync {
namespace provider {

// ============================================================================
// Transaction Parts
// ============================================================================

/// A transaction output, or the parent output an input spends
struct TxOutput {
    std::optional<std::string> address;  // nullopt for non-standard scripts
    Amount value{0};
    std::string scriptHex;
    uint32_t index{0};
    std::string txid;                    // transaction that owns this output
    Height height{0};                    // height of the spending/owning tx

    bool operator==(const TxOutput& other) const {
        return address == other.address && value == other.value &&
               scriptHex == other.scriptHex && index == other.index &&
               txid == other.txid && height == other.height;
    }
};

/// An input resolved to the output it spends
struct TxInput : TxOutput {
    std::string prevTxid;
    uint32_t prevIndex{0};
    Height prevHeight{0};
    bool coinbase{false};

    bool operator==(const TxInput& other) const {
        return TxOutput::operator==(other) && prevTxid == other.prevTxid &&
               prevIndex == other.prevIndex && prevHeight == other.prevHeight &&
               coinbase == other.coinbase;
    }
};

// ============================================================================
// Decorated Transaction
// ============================================================================

struct DecoratedTransaction {
    std::string txid;
    Height height{0};                          // 0 = unconfirmed
    std::vector<TxOutput> outputs;
    std::vector<TxInput> inputs;
    std::vector<bool> standardOutputs;         // aligned with outputs
    std::vector<bool> standardInputs;          // aligned with inputs
    std::vector<std::string> unconfirmedInputs;// parent txids still at height 0
    Amount fee{0};

    bool operator==(const DecoratedTransaction& other) const {
        return txid == other.txid && height == other.height &&
               outputs == other.outputs && inputs == other.inputs &&
               standardOutputs == other.standardOutputs &&
               standardInputs == other.standardInputs &&
               unconfirmedInputs == other.unconfirmedInputs && fee == other.fee;
    }
    bool operator!=(const DecoratedTransaction& other) const { return !(*this == other); }
};

using TxHistory = std::vector<DecoratedTransaction>;

// ============================================================================
// Events and Results
// ============================================================================

struct BlockEvent {
    Height height{0};
    std::string hash;
    std::string raw;  // serialized block, hex
};

struct TransactionEvent {
    rpc::JSONValue decoded;      // decoderawtransaction result
    std::string matchedAddress;  // subscription handle of the watched address
};

struct AddressBalance {
    Amount confirmed{0};
    Amount unconfirmed{0};
};

struct TxFetchOptions {
    bool cache{true};  // false forces a node round trip
};

} // namespace provider
} // namespace chainsync

#endif // CHAINSYNC_PROVIDER_TRANSACTION_H
