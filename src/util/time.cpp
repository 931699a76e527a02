// CHAINSYNC - Time Utilities Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/util/time.h>

#include <atomic>
#include <mutex>

namespace chainsync {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t RealTimeMillis() {
        return std::chrono::duration_cast<Milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return RealTimeMillis();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(RealTimeMillis());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t millis) {
    g_mockTime.store(millis);
}

void AdvanceMockTime(Milliseconds duration) {
    g_mockTime.fetch_add(duration.count());
}

} // namespace util
} // namespace chainsync
