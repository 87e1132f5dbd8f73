#include "skybridge/api/SnapshotApi.hpp"
#include "skybridge/telemetry/TelemetryJson.hpp"

#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace skybridge {

SnapshotApi::SnapshotApi(const StateStore& store,
                         const BroadcastHub& hub,
                         StatusSource link_status,
                         std::chrono::milliseconds stale_after)
    : store_(store),
      hub_(hub),
      link_status_(std::move(link_status)),
      stale_after_(stale_after) {}

ApiResponse SnapshotApi::snapshot(MonoTime now) const {
    SnapshotPtr snap = store_.get();
    if (!snap) {
        json err = {
            {"error", "unavailable"},
            {"detail", "no telemetry received since start"},
        };
        return {503, err.dump()};
    }
    return {200, render_snapshot(*snap, now, stale_after_)};
}

ApiResponse SnapshotApi::health(MonoTime now) const {
    const LinkStatus link = link_status_ ? link_status_() : LinkStatus{};
    const auto age = store_.age(now);

    json j;
    j["link"]        = to_string(link.state);
    j["age_ms"]      = age ? json(static_cast<uint64_t>(age->count())) : json(nullptr);
    j["stale"]       = !age || *age > stale_after_;
    j["subscribers"] = hub_.size();
    j["dropped"]     = hub_.dropped();
    j["frames"]      = link.frames;
    j["bad_frames"]  = link.bad_frames;
    j["snapshots"]   = link.snapshots;
    j["connects"]    = link.connects;
    return {200, j.dump()};
}

} // namespace skybridge
