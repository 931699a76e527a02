// CHAINSYNC - Notification Channel
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// A typed publish/subscribe channel. Each notification kind (new block,
// new transaction, client error, ...) gets its own Signal. Subscribers hold
// the returned SlotId and disconnect explicitly.

#ifndef CHAINSYNC_UTIL_SIGNAL_H
#define CHAINSYNC_UTIL_SIGNAL_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace chainsync {
namespace util {

/// Handle returned by Signal::Connect
using SlotId = uint64_t;

template<typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a slot; returns a handle for Disconnect
    SlotId Connect(Slot slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        SlotId id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a slot; returns false if the handle is unknown
    bool Disconnect(SlotId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.erase(id) > 0;
    }

    void DisconnectAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.clear();
    }

    size_t SlotCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    /// Invoke every slot. Slots run outside the lock so they may
    /// connect or disconnect.
    void Emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& entry : slots_) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

private:
    mutable std::mutex mutex_;
    std::map<SlotId, Slot> slots_;
    SlotId nextId_{1};
};

} // namespace util
} // namespace chainsync

#endif // CHAINSYNC_UTIL_SIGNAL_H
