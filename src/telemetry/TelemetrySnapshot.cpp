#include "skybridge/telemetry/TelemetrySnapshot.hpp"

namespace skybridge {

namespace {

template <typename T>
void take(std::optional<T>& dst, const std::optional<T>& src) {
    if (src) dst = src;
}

} // namespace

void merge_fields(TelemetryFields& into, const TelemetryFields& update) {
    take(into.lat, update.lat);
    take(into.lon, update.lon);
    take(into.alt, update.alt);
    take(into.relative_alt, update.relative_alt);
    take(into.roll, update.roll);
    take(into.pitch, update.pitch);
    take(into.yaw, update.yaw);
    take(into.battery, update.battery);
    take(into.voltage, update.voltage);
    take(into.current, update.current);
    take(into.gps_fix, update.gps_fix);
    take(into.satellites, update.satellites);
    take(into.armed, update.armed);
    take(into.custom_mode, update.custom_mode);
    take(into.mode, update.mode);
}

bool has_any(const TelemetryFields& f) {
    return f.lat || f.lon || f.alt || f.relative_alt ||
           f.roll || f.pitch || f.yaw ||
           f.battery || f.voltage || f.current ||
           f.gps_fix || f.satellites || f.armed || f.custom_mode || f.mode;
}

TelemetrySnapshot merge_snapshot(const TelemetrySnapshot* prev,
                                 const TelemetryUpdate& update,
                                 uint64_t seq,
                                 uint64_t ts_ms,
                                 MonoTime captured) {
    TelemetrySnapshot next;
    if (prev) next.values = prev->values;
    merge_fields(next.values, update);
    next.seq      = seq;
    next.ts_ms    = ts_ms;
    next.captured = captured;
    return next;
}

uint64_t wall_clock_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count()
    );
}

} // namespace skybridge
