// CHAINSYNC - Time Utilities
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Wall-clock helpers with a mock clock for tests. Cache expiry and request
// ids read time through GetTimeMillis() so tests can move time forward.

#ifndef CHAINSYNC_UTIL_TIME_H
#define CHAINSYNC_UTIL_TIME_H

#include <chrono>
#include <cstdint>

namespace chainsync {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in milliseconds
int64_t GetTimeMillis();

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode (starts at the current real time if unset)
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time in Unix milliseconds
void SetMockTime(int64_t millis);

/// Advance mock time by duration
void AdvanceMockTime(Milliseconds duration);

} // namespace util
} // namespace chainsync

#endif // CHAINSYNC_UTIL_TIME_H
