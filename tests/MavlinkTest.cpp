#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include "skybridge/mavlink/MavlinkFrame.hpp"
#include "skybridge/mavlink/MavlinkMessages.hpp"

using namespace skybridge;
using namespace skybridge::mavlink;

namespace {

constexpr uint8_t kSysId  = 1;
constexpr uint8_t kCompId = MAV_COMP_ID_AUTOPILOT1;

constexpr mavlink_channel_t kV2Chan     = MAVLINK_COMM_0;
constexpr mavlink_channel_t kV1Chan     = MAVLINK_COMM_1;
constexpr mavlink_channel_t kSignedChan = MAVLINK_COMM_2;

mavlink_channel_t chan_for(int version) {
    if (version == 1) {
        mavlink_get_channel_status(kV1Chan)->flags |= MAVLINK_STATUS_FLAG_OUT_MAVLINK1;
        return kV1Chan;
    }
    return kV2Chan;
}

mavlink_message_t heartbeat(uint8_t type, uint8_t autopilot, uint8_t base_mode,
                            uint32_t custom_mode) {
    mavlink_heartbeat_t hb{};
    hb.type        = type;
    hb.autopilot   = autopilot;
    hb.base_mode   = base_mode;
    hb.custom_mode = custom_mode;
    mavlink_message_t msg;
    mavlink_msg_heartbeat_encode_chan(kSysId, kCompId, kV2Chan, &msg, &hb);
    return msg;
}

mavlink_message_t attitude(float roll, float pitch, float yaw, int version = 2) {
    mavlink_attitude_t att{};
    att.time_boot_ms = 1000;
    att.roll  = roll;
    att.pitch = pitch;
    att.yaw   = yaw;
    att.rollspeed = 0.01f;
    att.pitchspeed = 0.02f;
    att.yawspeed = 0.03f;
    mavlink_message_t msg;
    mavlink_msg_attitude_encode_chan(kSysId, kCompId, chan_for(version), &msg, &att);
    return msg;
}

mavlink_message_t global_position(int32_t lat_e7, int32_t lon_e7, int32_t alt_mm,
                                  int32_t relative_alt_mm) {
    mavlink_global_position_int_t pos{};
    pos.lat          = lat_e7;
    pos.lon          = lon_e7;
    pos.alt          = alt_mm;
    pos.relative_alt = relative_alt_mm;
    mavlink_message_t msg;
    mavlink_msg_global_position_int_encode_chan(kSysId, kCompId, kV2Chan, &msg, &pos);
    return msg;
}

mavlink_message_t sys_status(uint16_t voltage_mv, int16_t current_ca, int8_t remaining) {
    mavlink_sys_status_t st{};
    st.voltage_battery   = voltage_mv;
    st.current_battery   = current_ca;
    st.battery_remaining = remaining;
    mavlink_message_t msg;
    mavlink_msg_sys_status_encode_chan(kSysId, kCompId, kV2Chan, &msg, &st);
    return msg;
}

mavlink_message_t gps_raw(uint8_t fix, uint8_t sats, int version = 2) {
    mavlink_gps_raw_int_t gps{};
    gps.lat = 1;
    gps.lon = 2;
    gps.alt = 3;
    gps.fix_type = fix;
    gps.satellites_visible = sats;
    mavlink_message_t msg;
    mavlink_msg_gps_raw_int_encode_chan(kSysId, kCompId, chan_for(version), &msg, &gps);
    return msg;
}

mavlink_message_t battery(int16_t current_ca, int8_t remaining) {
    mavlink_battery_status_t bat{};
    bat.current_consumed = -1;
    bat.energy_consumed  = -1;
    bat.temperature      = std::numeric_limits<int16_t>::max();
    for (auto& v : bat.voltages) v = std::numeric_limits<uint16_t>::max();
    bat.current_battery   = current_ca;
    bat.battery_remaining = remaining;
    mavlink_message_t msg;
    mavlink_msg_battery_status_encode_chan(kSysId, kCompId, kV2Chan, &msg, &bat);
    return msg;
}

std::vector<mavlink_message_t> parse_all(FrameParser& parser, const std::vector<uint8_t>& bytes) {
    std::vector<mavlink_message_t> out;
    parser.feed(bytes.data(), bytes.size(), out);
    return out;
}

std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> all;
    for (const auto& p : parts) all.insert(all.end(), p.begin(), p.end());
    return all;
}

// Round trip through the wire so decode sees what a link would deliver.
mavlink_message_t over_wire(const mavlink_message_t& msg) {
    FrameParser parser;
    auto frames = parse_all(parser, to_wire(msg));
    EXPECT_EQ(frames.size(), 1u);
    return frames.empty() ? mavlink_message_t{} : frames.front();
}

} // namespace

TEST(MavlinkFrame, V1Frame) {
    auto bytes = to_wire(attitude(0.1f, -0.2f, 1.5f, 1));
    ASSERT_EQ(bytes.front(), MAVLINK_STX_MAVLINK1);

    FrameParser parser;
    auto frames = parse_all(parser, bytes);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(version_of(frames[0]), 1);
    EXPECT_EQ(frames[0].msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_ATTITUDE));
    EXPECT_EQ(frames[0].len, MAVLINK_MSG_ID_ATTITUDE_LEN);

    auto up = decode(frames[0]);
    ASSERT_TRUE(up.has_value());
    EXPECT_NEAR(*up->yaw, 85.9437, 1e-3);
}

TEST(MavlinkFrame, V2FrameIsTruncatedAndZeroExtendedOnDecode) {
    // relative_alt, velocities and heading are zero, so the tail is cut.
    auto msg = over_wire(global_position(337490000, -843880000, 315000, 0));
    EXPECT_EQ(version_of(msg), 2);
    EXPECT_LT(msg.len, MAVLINK_MSG_ID_GLOBAL_POSITION_INT_LEN);

    auto up = decode(msg);
    ASSERT_TRUE(up.has_value());
    EXPECT_NEAR(*up->lat, 33.749, 1e-7);
    EXPECT_NEAR(*up->lon, -84.388, 1e-7);
    EXPECT_DOUBLE_EQ(*up->alt, 315.0);
    EXPECT_DOUBLE_EQ(*up->relative_alt, 0.0);
}

TEST(MavlinkFrame, ShortV1PayloadIsRejected) {
    mavlink_message_t msg{};
    msg.magic = MAVLINK_STX_MAVLINK1;
    msg.msgid = MAVLINK_MSG_ID_ATTITUDE;
    msg.len   = 10;
    EXPECT_FALSE(decode(msg).has_value());
}

TEST(MavlinkFrame, CorruptFrameDoesNotHideTheNextOne) {
    auto bad = to_wire(attitude(0.1f, 0.2f, 0.3f));
    bad[MAVLINK_NUM_HEADER_BYTES + 1] ^= 0xFF;   // payload byte
    auto good = to_wire(heartbeat(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_ARDUPILOTMEGA,
                                  MAV_MODE_FLAG_SAFETY_ARMED, 4));

    FrameParser parser;
    auto frames = parse_all(parser, concat({bad, good}));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_HEARTBEAT));
    EXPECT_GE(parser.bad_frames(), 1u);
    EXPECT_EQ(parser.take_bad_frames(), parser.bad_frames());
    EXPECT_EQ(parser.take_bad_frames(), 0u);
}

TEST(MavlinkFrame, GarbageAndSplitReads) {
    auto a = to_wire(sys_status(12400, 1050, 80));
    auto b = to_wire(gps_raw(3, 12, 1));
    auto stream = concat({{0x00, 0x42, 0x13}, a, {0x99}, b});

    FrameParser parser;
    std::vector<mavlink_message_t> out;
    for (uint8_t byte : stream) parser.feed(&byte, 1, out);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_SYS_STATUS));
    EXPECT_EQ(out[1].msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_GPS_RAW_INT));
    EXPECT_EQ(version_of(out[1]), 1);
    EXPECT_EQ(parser.bad_frames(), 0u);
}

TEST(MavlinkFrame, IdOutsideDialectIsDropped) {
    // Message id 0xFFFF00 is not defined, so its checksum cannot be verified.
    std::vector<uint8_t> unknown = {MAVLINK_STX, 4, 0, 0, 0, 1, 1, 0x00, 0xFF, 0xFF,
                                    1, 2, 3, 4, 0xAA, 0xBB};
    auto good = to_wire(attitude(0.0f, 0.0f, 1.0f));

    FrameParser parser;
    auto frames = parse_all(parser, concat({unknown, good}));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_ATTITUDE));
    EXPECT_GE(parser.bad_frames(), 1u);
}

TEST(MavlinkFrame, NonTelemetryMessageIsParsedAndIgnored) {
    mavlink_message_t msg;
    mavlink_vfr_hud_t hud{};
    hud.airspeed = 12.0f;
    hud.groundspeed = 11.5f;
    hud.heading = 90;
    hud.throttle = 40;
    mavlink_msg_vfr_hud_encode_chan(kSysId, kCompId, kV2Chan, &msg, &hud);

    auto parsed = over_wire(msg);
    EXPECT_EQ(parsed.msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_VFR_HUD));
    EXPECT_FALSE(decode(parsed).has_value());
}

TEST(MavlinkFrame, SignedFrameIsAcceptedUnverified) {
    mavlink_signing_t signing{};
    signing.flags     = MAVLINK_SIGNING_FLAG_SIGN_OUTGOING;
    signing.link_id   = 7;
    signing.timestamp = 1;
    std::memset(signing.secret_key, 0x5A, sizeof(signing.secret_key));

    mavlink_status_t* status = mavlink_get_channel_status(kSignedChan);
    status->signing = &signing;
    mavlink_attitude_t att{};
    att.roll = 0.5f;
    mavlink_message_t msg;
    mavlink_msg_attitude_encode_chan(kSysId, kCompId, kSignedChan, &msg, &att);
    status->signing = nullptr;

    auto bytes = to_wire(msg);
    ASSERT_EQ(bytes.size(),
              static_cast<std::size_t>(MAVLINK_NUM_NON_PAYLOAD_BYTES + msg.len + MAVLINK_SIGNATURE_BLOCK_LEN));
    auto next = to_wire(heartbeat(MAV_TYPE_GCS, MAV_AUTOPILOT_INVALID, 0, 0));

    FrameParser parser;
    auto frames = parse_all(parser, concat({bytes, next}));
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_ATTITUDE));
    EXPECT_NE(frames[0].incompat_flags & MAVLINK_IFLAG_SIGNED, 0);
    EXPECT_EQ(frames[1].msgid, static_cast<uint32_t>(MAVLINK_MSG_ID_HEARTBEAT));
    EXPECT_EQ(parser.bad_frames(), 0u);
}

TEST(MavlinkDecode, HeartbeatFromVehicle) {
    auto up = decode(over_wire(heartbeat(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_ARDUPILOTMEGA,
                                         MAV_MODE_FLAG_SAFETY_ARMED | MAV_MODE_FLAG_CUSTOM_MODE_ENABLED,
                                         COPTER_MODE_GUIDED)));
    ASSERT_TRUE(up.has_value());
    EXPECT_TRUE(*up->armed);
    EXPECT_EQ(*up->custom_mode, 4u);
    EXPECT_EQ(*up->mode, "GUIDED");

    up = decode(over_wire(heartbeat(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_ARDUPILOTMEGA,
                                    MAV_MODE_FLAG_CUSTOM_MODE_ENABLED, COPTER_MODE_STABILIZE)));
    ASSERT_TRUE(up.has_value());
    EXPECT_FALSE(*up->armed);
    EXPECT_EQ(*up->mode, "STABILIZE");
}

TEST(MavlinkDecode, GroundStationHeartbeatCarriesNothing) {
    auto up = decode(over_wire(heartbeat(MAV_TYPE_GCS, MAV_AUTOPILOT_INVALID, 0, 0)));
    ASSERT_TRUE(up.has_value());
    EXPECT_FALSE(has_any(*up));
}

TEST(MavlinkDecode, ModeNameFollowsVehicleType) {
    const uint8_t custom = MAV_MODE_FLAG_CUSTOM_MODE_ENABLED;

    EXPECT_EQ(mode_name(MAV_TYPE_HEXAROTOR, MAV_AUTOPILOT_ARDUPILOTMEGA, custom, 6), "RTL");
    EXPECT_EQ(mode_name(MAV_TYPE_FIXED_WING, MAV_AUTOPILOT_ARDUPILOTMEGA, custom, 10), "AUTO");
    EXPECT_EQ(mode_name(MAV_TYPE_FIXED_WING, MAV_AUTOPILOT_ARDUPILOTMEGA, custom, 5), "FBWA");
    EXPECT_EQ(mode_name(MAV_TYPE_FIXED_WING, MAV_AUTOPILOT_ARDUPILOTMEGA, custom, 6), "FBWB");
    EXPECT_EQ(mode_name(MAV_TYPE_GROUND_ROVER, MAV_AUTOPILOT_ARDUPILOTMEGA, custom, 4), "HOLD");
    EXPECT_EQ(mode_name(MAV_TYPE_SURFACE_BOAT, MAV_AUTOPILOT_ARDUPILOTMEGA, custom, 15), "GUIDED");

    // Same number, different vehicle, different mode.
    EXPECT_EQ(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_ARDUPILOTMEGA, custom, 5), "LOITER");
}

TEST(MavlinkDecode, Px4ModesUseMainAndSubMode) {
    const uint8_t custom = MAV_MODE_FLAG_CUSTOM_MODE_ENABLED;
    auto px4 = [](uint32_t main_mode, uint32_t sub_mode) {
        return (main_mode << 16) | (sub_mode << 24);
    };

    EXPECT_EQ(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_PX4, custom, px4(3, 0)), "POSCTL");
    EXPECT_EQ(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_PX4, custom, px4(6, 0)), "OFFBOARD");
    EXPECT_EQ(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_PX4, custom, px4(4, 4)), "MISSION");
    EXPECT_EQ(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_PX4, custom, px4(4, 5)), "RTL");
    EXPECT_FALSE(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_PX4, custom, px4(4, 0)).has_value());
    EXPECT_FALSE(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_PX4, custom, px4(42, 0)).has_value());
}

TEST(MavlinkDecode, UnknownModeIsNullButNumberIsKept) {
    auto up = decode(over_wire(heartbeat(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_ARDUPILOTMEGA,
                                         MAV_MODE_FLAG_CUSTOM_MODE_ENABLED, 99)));
    ASSERT_TRUE(up.has_value());
    EXPECT_FALSE(up->mode.has_value());
    EXPECT_EQ(*up->custom_mode, 99u);

    // Custom mode not enabled: the number carries no meaning.
    EXPECT_FALSE(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_ARDUPILOTMEGA, 0, 4).has_value());
    EXPECT_FALSE(mode_name(MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_GENERIC,
                           MAV_MODE_FLAG_CUSTOM_MODE_ENABLED, 4).has_value());
    EXPECT_FALSE(mode_name(MAV_TYPE_SUBMARINE, MAV_AUTOPILOT_ARDUPILOTMEGA,
                           MAV_MODE_FLAG_CUSTOM_MODE_ENABLED, 4).has_value());
}

TEST(MavlinkDecode, SysStatusUnits) {
    auto up = decode(over_wire(sys_status(12450, 1275, 73)));
    ASSERT_TRUE(up.has_value());
    EXPECT_DOUBLE_EQ(*up->voltage, 12.45);
    EXPECT_DOUBLE_EQ(*up->current, 12.75);
    EXPECT_DOUBLE_EQ(*up->battery, 73.0);
}

TEST(MavlinkDecode, UnknownSentinelsStayUnknown) {
    auto up = decode(over_wire(sys_status(0xFFFF, -1, -1)));
    ASSERT_TRUE(up.has_value());
    EXPECT_FALSE(up->voltage.has_value());
    EXPECT_FALSE(up->current.has_value());
    EXPECT_FALSE(up->battery.has_value());

    up = decode(over_wire(battery(-1, -1)));
    ASSERT_TRUE(up.has_value());
    EXPECT_FALSE(has_any(*up));

    up = decode(over_wire(gps_raw(0, 255)));
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(*up->gps_fix, 0);
    EXPECT_FALSE(up->satellites.has_value());
}

TEST(MavlinkDecode, AttitudeInDegrees) {
    auto up = decode(over_wire(attitude(0.5f, -0.25f, 3.14159265f)));
    ASSERT_TRUE(up.has_value());
    EXPECT_NEAR(*up->roll, 28.6479, 1e-3);
    EXPECT_NEAR(*up->pitch, -14.3239, 1e-3);
    EXPECT_NEAR(*up->yaw, 180.0, 1e-3);
}

TEST(MavlinkDecode, NonFiniteAttitudeIsUnknown) {
    auto up = decode(over_wire(attitude(std::numeric_limits<float>::quiet_NaN(),
                                        0.1f,
                                        std::numeric_limits<float>::infinity())));
    ASSERT_TRUE(up.has_value());
    EXPECT_FALSE(up->roll.has_value());
    EXPECT_FALSE(up->yaw.has_value());
    ASSERT_TRUE(up->pitch.has_value());
    EXPECT_TRUE(std::isfinite(*up->pitch));
}

TEST(MavlinkDecode, GlobalPositionUnits) {
    auto up = decode(over_wire(global_position(-338600000, 1512100000, 52500, 12250)));
    ASSERT_TRUE(up.has_value());
    EXPECT_NEAR(*up->lat, -33.86, 1e-7);
    EXPECT_NEAR(*up->lon, 151.21, 1e-7);
    EXPECT_DOUBLE_EQ(*up->alt, 52.5);
    EXPECT_DOUBLE_EQ(*up->relative_alt, 12.25);
    EXPECT_FALSE(up->battery.has_value());
}

TEST(MavlinkDecode, BatteryStatus) {
    auto up = decode(over_wire(battery(830, 64)));
    ASSERT_TRUE(up.has_value());
    EXPECT_DOUBLE_EQ(*up->current, 8.3);
    EXPECT_DOUBLE_EQ(*up->battery, 64.0);
}
