// CHAINSYNC - Block Subsidy Schedule Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/core/reward.h>

namespace chainsync {

Amount GetBlockSubsidy(Height height) {
    if (height < 0) {
        height = 0;
    }
    
    Height halvings = height / HALVING_INTERVAL;
    
    // Shifting by 64 or more is undefined; the subsidy is zero by then anyway
    if (halvings >= 64) {
        return 0;
    }
    
    return INITIAL_BLOCK_REWARD >> halvings;
}

} // namespace chainsync
