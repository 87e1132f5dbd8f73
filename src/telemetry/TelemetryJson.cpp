#include "skybridge/telemetry/TelemetryJson.hpp"

using json = nlohmann::json;

namespace skybridge {

namespace {

template <typename T>
json opt(const std::optional<T>& v) {
    if (!v) return json(nullptr);
    return json(*v);
}

} // namespace

std::chrono::milliseconds snapshot_age(const TelemetrySnapshot& snap, MonoTime now) {
    if (now <= snap.captured) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - snap.captured);
}

json snapshot_to_json(const TelemetrySnapshot& snap,
                      MonoTime now,
                      std::chrono::milliseconds stale_after) {
    const auto& v = snap.values;
    const auto age = snapshot_age(snap, now);

    json j;
    j["lat"]          = opt(v.lat);
    j["lon"]          = opt(v.lon);
    j["alt"]          = opt(v.alt);
    j["roll"]         = opt(v.roll);
    j["pitch"]        = opt(v.pitch);
    j["yaw"]          = opt(v.yaw);
    j["battery"]      = opt(v.battery);
    j["relative_alt"] = opt(v.relative_alt);
    j["voltage"]      = opt(v.voltage);
    j["current"]      = opt(v.current);
    j["gps_fix"]      = opt(v.gps_fix);
    j["satellites"]   = opt(v.satellites);
    j["armed"]        = opt(v.armed);
    j["mode"]         = opt(v.mode);
    j["custom_mode"]  = opt(v.custom_mode);
    j["seq"]          = snap.seq;
    j["ts"]           = snap.ts_ms;
    j["age_ms"]       = static_cast<uint64_t>(age.count());
    j["stale"]        = age > stale_after;
    return j;
}

std::string render_snapshot(const TelemetrySnapshot& snap,
                            MonoTime now,
                            std::chrono::milliseconds stale_after) {
    return snapshot_to_json(snap, now, stale_after).dump();
}

} // namespace skybridge
