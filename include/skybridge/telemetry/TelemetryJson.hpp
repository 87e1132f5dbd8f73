#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "skybridge/telemetry/TelemetrySnapshot.hpp"

namespace skybridge {

// Wire schema shared by the pull endpoint and the push stream:
//   {"lat":..,"lon":..,"alt":..,"roll":..,"pitch":..,"yaw":..,"battery":..,
//    "relative_alt":..,"voltage":..,"current":..,"gps_fix":..,"satellites":..,
//    "armed":..,"mode":"GUIDED","custom_mode":..,"seq":N,"ts":ms,"age_ms":N,
//    "stale":bool}
// Unknown values are null.
nlohmann::json snapshot_to_json(const TelemetrySnapshot& snap,
                                MonoTime now,
                                std::chrono::milliseconds stale_after);

std::string render_snapshot(const TelemetrySnapshot& snap,
                            MonoTime now,
                            std::chrono::milliseconds stale_after);

// now - captured, clamped at zero.
std::chrono::milliseconds snapshot_age(const TelemetrySnapshot& snap, MonoTime now);

} // namespace skybridge
