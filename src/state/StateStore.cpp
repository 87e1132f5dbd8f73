#include "skybridge/state/StateStore.hpp"
#include "skybridge/telemetry/TelemetryJson.hpp"

#include <utility>

namespace skybridge {

SnapshotPtr StateStore::get() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
}

void StateStore::replace(SnapshotPtr snap) {
    if (!snap) return;
    std::lock_guard<std::mutex> lock(mtx_);
    current_ = std::move(snap);
}

std::optional<std::chrono::milliseconds> StateStore::age(MonoTime now) const {
    SnapshotPtr snap = get();
    if (!snap) return std::nullopt;
    return snapshot_age(*snap, now);
}

} // namespace skybridge
