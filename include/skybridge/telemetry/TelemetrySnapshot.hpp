#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace skybridge {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;

// ---------------------------------------------------------------------------
// Every field is optional. An empty optional means "never reported by the
// vehicle" and is rendered as null, never as 0 / false.
// ---------------------------------------------------------------------------
struct TelemetryFields {
    std::optional<double> lat;           // deg
    std::optional<double> lon;           // deg
    std::optional<double> alt;           // m, AMSL
    std::optional<double> relative_alt;  // m, above home
    std::optional<double> roll;          // deg
    std::optional<double> pitch;         // deg
    std::optional<double> yaw;           // deg
    std::optional<double> battery;       // percent remaining
    std::optional<double> voltage;       // V
    std::optional<double> current;       // A

    std::optional<int>      gps_fix;
    std::optional<int>      satellites;
    std::optional<bool>     armed;
    std::optional<uint32_t> custom_mode; // raw HEARTBEAT custom_mode
    std::optional<std::string> mode;     // flight mode name, e.g. "GUIDED"
};

// Partial field set carried by a single decoded message.
using TelemetryUpdate = TelemetryFields;

struct TelemetrySnapshot {
    TelemetryFields values;
    uint64_t seq{0};       // strictly increasing per process
    uint64_t ts_ms{0};     // wall clock, ms since epoch
    MonoTime captured{};   // monotonic capture time, used for age
};

using SnapshotPtr = std::shared_ptr<const TelemetrySnapshot>;

// Overwrites only the fields present in update.
void merge_fields(TelemetryFields& into, const TelemetryFields& update);

bool has_any(const TelemetryFields& f);

// Builds the successor of prev (may be null) carrying update.
TelemetrySnapshot merge_snapshot(const TelemetrySnapshot* prev,
                                 const TelemetryUpdate& update,
                                 uint64_t seq,
                                 uint64_t ts_ms,
                                 MonoTime captured);

uint64_t wall_clock_ms();

} // namespace skybridge
