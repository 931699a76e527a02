// CHAINSYNC - Block Subsidy Schedule
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#ifndef CHAINSYNC_CORE_REWARD_H
#define CHAINSYNC_CORE_REWARD_H

#include <chainsync/core/types.h>

namespace chainsync {

/// Subsidy paid by the first block
constexpr Amount INITIAL_BLOCK_REWARD = 50 * COIN;

/// Blocks between subsidy halvings
constexpr Height HALVING_INTERVAL = 210000;

/**
 * Get the block subsidy at a given height.
 * 
 * The subsidy starts at INITIAL_BLOCK_REWARD and is halved (floor division)
 * every HALVING_INTERVAL blocks. Negative heights are treated as 0.
 * 
 * @param height Block height
 * @return Subsidy in base units
 */
Amount GetBlockSubsidy(Height height);

} // namespace chainsync

#endif // CHAINSYNC_CORE_REWARD_H
