#include "skybridge/mavlink/MavlinkMessages.hpp"

#include <cmath>
#include <limits>
#include <unordered_map>

namespace skybridge::mavlink {

namespace {

constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;

using ModeTable = std::unordered_map<uint32_t, const char*>;

const ModeTable& copter_modes() {
    static const ModeTable t = {
        {COPTER_MODE_STABILIZE,    "STABILIZE"},
        {COPTER_MODE_ACRO,         "ACRO"},
        {COPTER_MODE_ALT_HOLD,     "ALT_HOLD"},
        {COPTER_MODE_AUTO,         "AUTO"},
        {COPTER_MODE_GUIDED,       "GUIDED"},
        {COPTER_MODE_LOITER,       "LOITER"},
        {COPTER_MODE_RTL,          "RTL"},
        {COPTER_MODE_CIRCLE,       "CIRCLE"},
        {COPTER_MODE_LAND,         "LAND"},
        {COPTER_MODE_DRIFT,        "DRIFT"},
        {COPTER_MODE_SPORT,        "SPORT"},
        {COPTER_MODE_FLIP,         "FLIP"},
        {COPTER_MODE_AUTOTUNE,     "AUTOTUNE"},
        {COPTER_MODE_POSHOLD,      "POSHOLD"},
        {COPTER_MODE_BRAKE,        "BRAKE"},
        {COPTER_MODE_THROW,        "THROW"},
        {COPTER_MODE_AVOID_ADSB,   "AVOID_ADSB"},
        {COPTER_MODE_GUIDED_NOGPS, "GUIDED_NOGPS"},
        {COPTER_MODE_SMART_RTL,    "SMART_RTL"},
        {COPTER_MODE_FLOWHOLD,     "FLOWHOLD"},
        {COPTER_MODE_FOLLOW,       "FOLLOW"},
        {COPTER_MODE_ZIGZAG,       "ZIGZAG"},
        {COPTER_MODE_SYSTEMID,     "SYSTEMID"},
    };
    return t;
}

const ModeTable& plane_modes() {
    static const ModeTable t = {
        {PLANE_MODE_MANUAL,        "MANUAL"},
        {PLANE_MODE_CIRCLE,        "CIRCLE"},
        {PLANE_MODE_STABILIZE,     "STABILIZE"},
        {PLANE_MODE_TRAINING,      "TRAINING"},
        {PLANE_MODE_ACRO,          "ACRO"},
        {PLANE_MODE_FLY_BY_WIRE_A, "FBWA"},
        {PLANE_MODE_FLY_BY_WIRE_B, "FBWB"},
        {PLANE_MODE_CRUISE,        "CRUISE"},
        {PLANE_MODE_AUTOTUNE,      "AUTOTUNE"},
        {PLANE_MODE_AUTO,          "AUTO"},
        {PLANE_MODE_RTL,           "RTL"},
        {PLANE_MODE_LOITER,        "LOITER"},
        {PLANE_MODE_TAKEOFF,       "TAKEOFF"},
        {PLANE_MODE_AVOID_ADSB,    "AVOID_ADSB"},
        {PLANE_MODE_GUIDED,        "GUIDED"},
        {PLANE_MODE_INITIALIZING,  "INITIALISING"},
        {PLANE_MODE_QSTABILIZE,    "QSTABILIZE"},
        {PLANE_MODE_QHOVER,        "QHOVER"},
        {PLANE_MODE_QLOITER,       "QLOITER"},
        {PLANE_MODE_QLAND,         "QLAND"},
        {PLANE_MODE_QRTL,          "QRTL"},
        {PLANE_MODE_QAUTOTUNE,     "QAUTOTUNE"},
        {PLANE_MODE_QACRO,         "QACRO"},
    };
    return t;
}

const ModeTable& rover_modes() {
    static const ModeTable t = {
        {ROVER_MODE_MANUAL,       "MANUAL"},
        {ROVER_MODE_ACRO,         "ACRO"},
        {ROVER_MODE_STEERING,     "STEERING"},
        {ROVER_MODE_HOLD,         "HOLD"},
        {ROVER_MODE_LOITER,       "LOITER"},
        {ROVER_MODE_FOLLOW,       "FOLLOW"},
        {ROVER_MODE_SIMPLE,       "SIMPLE"},
        {ROVER_MODE_AUTO,         "AUTO"},
        {ROVER_MODE_RTL,          "RTL"},
        {ROVER_MODE_SMART_RTL,    "SMART_RTL"},
        {ROVER_MODE_GUIDED,       "GUIDED"},
        {ROVER_MODE_INITIALIZING, "INITIALISING"},
    };
    return t;
}

// PX4 packs main mode into byte 2 and sub mode into byte 3 of custom_mode.
// The numbering lives in PX4's px4_custom_mode.h, not in the XML dialects.
enum Px4MainMode : uint8_t {
    PX4_MAIN_MANUAL     = 1,
    PX4_MAIN_ALTCTL     = 2,
    PX4_MAIN_POSCTL     = 3,
    PX4_MAIN_AUTO       = 4,
    PX4_MAIN_ACRO       = 5,
    PX4_MAIN_OFFBOARD   = 6,
    PX4_MAIN_STABILIZED = 7,
    PX4_MAIN_RATTITUDE  = 8,
};

enum Px4AutoSubMode : uint8_t {
    PX4_AUTO_READY         = 1,
    PX4_AUTO_TAKEOFF       = 2,
    PX4_AUTO_LOITER        = 3,
    PX4_AUTO_MISSION       = 4,
    PX4_AUTO_RTL           = 5,
    PX4_AUTO_LAND          = 6,
    PX4_AUTO_FOLLOW_TARGET = 8,
    PX4_AUTO_PRECLAND      = 9,
};

std::optional<std::string> px4_mode(uint32_t custom_mode) {
    const uint8_t main_mode = (custom_mode >> 16) & 0xFF;
    const uint8_t sub_mode  = (custom_mode >> 24) & 0xFF;

    switch (main_mode) {
    case PX4_MAIN_MANUAL:     return std::string("MANUAL");
    case PX4_MAIN_ALTCTL:     return std::string("ALTCTL");
    case PX4_MAIN_POSCTL:     return std::string("POSCTL");
    case PX4_MAIN_ACRO:       return std::string("ACRO");
    case PX4_MAIN_OFFBOARD:   return std::string("OFFBOARD");
    case PX4_MAIN_STABILIZED: return std::string("STABILIZED");
    case PX4_MAIN_RATTITUDE:  return std::string("RATTITUDE");
    case PX4_MAIN_AUTO:
        switch (sub_mode) {
        case PX4_AUTO_READY:         return std::string("READY");
        case PX4_AUTO_TAKEOFF:       return std::string("TAKEOFF");
        case PX4_AUTO_LOITER:        return std::string("LOITER");
        case PX4_AUTO_MISSION:       return std::string("MISSION");
        case PX4_AUTO_RTL:           return std::string("RTL");
        case PX4_AUTO_LAND:          return std::string("LAND");
        case PX4_AUTO_FOLLOW_TARGET: return std::string("FOLLOWME");
        case PX4_AUTO_PRECLAND:      return std::string("PRECLAND");
        default:                     return std::nullopt;
        }
    default:
        return std::nullopt;
    }
}

const ModeTable* ardupilot_table(uint8_t type) {
    switch (type) {
    case MAV_TYPE_QUADROTOR:
    case MAV_TYPE_HEXAROTOR:
    case MAV_TYPE_OCTOROTOR:
    case MAV_TYPE_TRICOPTER:
    case MAV_TYPE_COAXIAL:
    case MAV_TYPE_HELICOPTER:
    case MAV_TYPE_DODECAROTOR:
        return &copter_modes();
    case MAV_TYPE_FIXED_WING:
    case MAV_TYPE_VTOL_TILTROTOR:
        return &plane_modes();
    case MAV_TYPE_GROUND_ROVER:
    case MAV_TYPE_SURFACE_BOAT:
        return &rover_modes();
    default:
        return nullptr;
    }
}

std::optional<double> finite_or_unknown(double v) {
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

TelemetryUpdate decode_heartbeat(const mavlink_message_t& msg) {
    mavlink_heartbeat_t hb;
    mavlink_msg_heartbeat_decode(&msg, &hb);

    TelemetryUpdate up;
    // Ground stations and companion software heartbeat on the same link.
    if (hb.type == MAV_TYPE_GCS || hb.autopilot == MAV_AUTOPILOT_INVALID) return up;

    up.armed       = (hb.base_mode & MAV_MODE_FLAG_SAFETY_ARMED) != 0;
    up.custom_mode = hb.custom_mode;
    up.mode        = mode_name(hb.type, hb.autopilot, hb.base_mode, hb.custom_mode);
    return up;
}

TelemetryUpdate decode_sys_status(const mavlink_message_t& msg) {
    mavlink_sys_status_t st;
    mavlink_msg_sys_status_decode(&msg, &st);

    TelemetryUpdate up;
    if (st.voltage_battery != std::numeric_limits<uint16_t>::max()) up.voltage = st.voltage_battery / 1000.0;
    if (st.current_battery != -1) up.current = st.current_battery / 100.0;
    if (st.battery_remaining != -1) up.battery = static_cast<double>(st.battery_remaining);
    return up;
}

TelemetryUpdate decode_gps_raw_int(const mavlink_message_t& msg) {
    mavlink_gps_raw_int_t gps;
    mavlink_msg_gps_raw_int_decode(&msg, &gps);

    TelemetryUpdate up;
    up.gps_fix = gps.fix_type;
    if (gps.satellites_visible != 255) up.satellites = gps.satellites_visible;
    return up;
}

TelemetryUpdate decode_attitude(const mavlink_message_t& msg) {
    mavlink_attitude_t att;
    mavlink_msg_attitude_decode(&msg, &att);

    TelemetryUpdate up;
    up.roll  = finite_or_unknown(att.roll * kRadToDeg);
    up.pitch = finite_or_unknown(att.pitch * kRadToDeg);
    up.yaw   = finite_or_unknown(att.yaw * kRadToDeg);
    return up;
}

TelemetryUpdate decode_global_position_int(const mavlink_message_t& msg) {
    mavlink_global_position_int_t pos;
    mavlink_msg_global_position_int_decode(&msg, &pos);

    TelemetryUpdate up;
    up.lat          = pos.lat / 1e7;
    up.lon          = pos.lon / 1e7;
    up.alt          = pos.alt / 1000.0;
    up.relative_alt = pos.relative_alt / 1000.0;
    return up;
}

TelemetryUpdate decode_battery_status(const mavlink_message_t& msg) {
    mavlink_battery_status_t bat;
    mavlink_msg_battery_status_decode(&msg, &bat);

    TelemetryUpdate up;
    if (bat.current_battery != -1) up.current = bat.current_battery / 100.0;
    if (bat.battery_remaining != -1) up.battery = static_cast<double>(bat.battery_remaining);
    return up;
}

} // namespace

std::optional<std::string> mode_name(uint8_t type, uint8_t autopilot,
                                     uint8_t base_mode, uint32_t custom_mode) {
    if ((base_mode & MAV_MODE_FLAG_CUSTOM_MODE_ENABLED) == 0) return std::nullopt;

    if (autopilot == MAV_AUTOPILOT_PX4) return px4_mode(custom_mode);
    if (autopilot != MAV_AUTOPILOT_ARDUPILOTMEGA) return std::nullopt;

    const ModeTable* table = ardupilot_table(type);
    if (!table) return std::nullopt;

    auto it = table->find(custom_mode);
    if (it == table->end()) return std::nullopt;
    return std::string(it->second);
}

std::optional<TelemetryUpdate> decode(const mavlink_message_t& msg) {
    // MAVLink 1 has no truncation; a short v1 payload is malformed.
    if (version_of(msg) == 1) {
        const mavlink_msg_entry_t* entry = mavlink_get_msg_entry(msg.msgid);
        if (entry && msg.len < entry->min_msg_len) return std::nullopt;
    }

    switch (msg.msgid) {
    case MAVLINK_MSG_ID_HEARTBEAT:           return decode_heartbeat(msg);
    case MAVLINK_MSG_ID_SYS_STATUS:          return decode_sys_status(msg);
    case MAVLINK_MSG_ID_GPS_RAW_INT:         return decode_gps_raw_int(msg);
    case MAVLINK_MSG_ID_ATTITUDE:            return decode_attitude(msg);
    case MAVLINK_MSG_ID_GLOBAL_POSITION_INT: return decode_global_position_int(msg);
    case MAVLINK_MSG_ID_BATTERY_STATUS:      return decode_battery_status(msg);
    default:                                 return std::nullopt;
    }
}

} // namespace skybridge::mavlink
