#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "skybridge/mavlink/MavlinkFrame.hpp"
#include "skybridge/telemetry/TelemetrySnapshot.hpp"

namespace skybridge::mavlink {

// nullopt: not a telemetry message, discard.
// Empty update: recognised but carries no vehicle field (e.g. GCS heartbeat).
// Non-finite floating values decode as unknown.
std::optional<TelemetryUpdate> decode(const mavlink_message_t& msg);

// Flight mode name for a HEARTBEAT, following ArduPilot's per-vehicle mode
// tables (Copter, Plane, Rover) and PX4's main/sub mode split.
// nullopt when custom mode is not enabled or the number is not in the table.
std::optional<std::string> mode_name(uint8_t type, uint8_t autopilot,
                                     uint8_t base_mode, uint32_t custom_mode);

} // namespace skybridge::mavlink
