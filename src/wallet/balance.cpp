// CHAINSYNC - Wallet Balances and Ledger Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/wallet/balance.h>

#include <algorithm>

namespace chainsync {
namespace wallet {

const char* TxStateToString(TxState state) {
    switch (state) {
        case TxState::Confirmed: return "confirmed";
        case TxState::Pending:   return "pending";
        case TxState::Mempool:   return "mempool";
    }
    return "unknown";
}

const char* DirectionToString(Direction dir) {
    return dir == Direction::In ? "in" : "out";
}

// ============================================================================
// Balance
// ============================================================================

Amount Balance::Get(TxState state) const {
    switch (state) {
        case TxState::Confirmed: return confirmed;
        case TxState::Pending:   return pending;
        case TxState::Mempool:   return mempool;
    }
    return 0;
}

void Balance::Add(TxState state, Amount value) {
    switch (state) {
        case TxState::Confirmed: confirmed += value; break;
        case TxState::Pending:   pending += value; break;
        case TxState::Mempool:   mempool += value; break;
    }
}

rpc::JSONValue Balance::ToJSON() const {
    rpc::JSONValue json;
    json["confirmed"] = confirmed;
    json["pending"] = pending;
    json["mempool"] = mempool;
    return json;
}

Balance Balance::FromJSON(const rpc::JSONValue& json) {
    Balance balance;
    balance.confirmed = json["confirmed"].GetInt();
    balance.pending = json["pending"].GetInt();
    balance.mempool = json["mempool"].GetInt();
    return balance;
}

// ============================================================================
// Ledger
// ============================================================================

rpc::JSONValue Ledger::ToJSON() const {
    rpc::JSONValue json;
    json["in"] = in.ToJSON();
    json["out"] = out.ToJSON();
    json["fee"] = fee.ToJSON();
    return json;
}

Ledger Ledger::FromJSON(const rpc::JSONValue& json) {
    Ledger ledger;
    ledger.in = Balance::FromJSON(json["in"]);
    ledger.out = Balance::FromJSON(json["out"]);
    ledger.fee = Balance::FromJSON(json["fee"]);
    return ledger;
}

bool AddressLedger::HasPoint(Direction dir, const std::string& point) const {
    const auto& points = dir == Direction::In ? inPoints : outPoints;
    return std::find(points.begin(), points.end(), point) != points.end();
}

void AddressLedger::RecordPoint(Direction dir, const std::string& point) {
    auto& points = dir == Direction::In ? inPoints : outPoints;
    points.push_back(point);
}

rpc::JSONValue AddressLedger::ToJSON() const {
    rpc::JSONValue json = Ledger::ToJSON();
    rpc::JSONValue::Array ins;
    for (const auto& p : inPoints) {
        ins.emplace_back(p);
    }
    rpc::JSONValue::Array outs;
    for (const auto& p : outPoints) {
        outs.emplace_back(p);
    }
    json["intxid"] = rpc::JSONValue(std::move(ins));
    json["outtxid"] = rpc::JSONValue(std::move(outs));
    return json;
}

AddressLedger AddressLedger::FromJSON(const rpc::JSONValue& json) {
    AddressLedger ledger;
    static_cast<Ledger&>(ledger) = Ledger::FromJSON(json);
    for (const auto& p : json["intxid"].GetArray()) {
        ledger.inPoints.push_back(p.GetString());
    }
    for (const auto& p : json["outtxid"].GetArray()) {
        ledger.outPoints.push_back(p.GetString());
    }
    return ledger;
}

Balance DeriveBalance(const Ledger& ledger) {
    Balance result;
    result.mempool = ledger.out.mempool - ledger.in.mempool;
    result.confirmed = ledger.out.confirmed - ledger.in.confirmed;
    Amount pending = ledger.in.pending - ledger.out.pending;
    result.pending = pending < 0 ? -pending : pending;
    return result;
}

} // namespace wallet
} // namespace chainsync
