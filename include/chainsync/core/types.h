// CHAINSYNC - Core Types Header
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Fundamental value types shared by the provider and the sync engine.

#ifndef CHAINSYNC_CORE_TYPES_H
#define CHAINSYNC_CORE_TYPES_H

#include <cstdint>
#include <string>

namespace chainsync {

// ============================================================================
// Amounts
// ============================================================================

/// Amount in smallest units (satoshis)
using Amount = int64_t;

/// Constants
constexpr Amount COIN = 100000000LL;               // 1 BTC = 100 million base units
constexpr Amount MAX_MONEY = 21000000LL * COIN;    // 21 million BTC

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

/// Convert a node-reported coin value (e.g. 0.5) to base units.
/// Rounds half away from zero; throws ValidationError for non-finite input.
Amount AmountFromValue(double value);

/// Format amount as a decimal coin string ("1.50000000")
std::string FormatAmount(Amount amount, int decimals = 8);

/// Block height (0 = unconfirmed)
using Height = int64_t;

} // namespace chainsync

#endif // CHAINSYNC_CORE_TYPES_H
