#pragma once

#include <chrono>
#include <mutex>
#include <optional>

#include "skybridge/telemetry/TelemetrySnapshot.hpp"

namespace skybridge {

// Holds the single latest snapshot. Snapshots are immutable once stored;
// replace() swaps the shared pointer, so a reader either sees the old object
// or the new one, never a mix. The lock covers the pointer swap only.
class StateStore {
public:
    // Null until the first replace().
    SnapshotPtr get() const;

    void replace(SnapshotPtr snap);

    // now - captured of the current snapshot; nullopt before the first one.
    std::optional<std::chrono::milliseconds> age(MonoTime now = MonoClock::now()) const;

private:
    mutable std::mutex mtx_;
    SnapshotPtr current_;
};

} // namespace skybridge
