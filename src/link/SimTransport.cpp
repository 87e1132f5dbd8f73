#include "skybridge/link/SimTransport.hpp"
#include "skybridge/mavlink/MavlinkFrame.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace skybridge {

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
constexpr double kHomeAltitudeM = 315.0;       // AMSL of the start point
constexpr uint8_t kSysId  = 1;
constexpr uint8_t kCompId = MAV_COMP_ID_AUTOPILOT1;
constexpr mavlink_channel_t kChannel = MAVLINK_COMM_0;

std::chrono::nanoseconds tick_period(double rate_hz) {
    if (!(rate_hz > 0.0)) throw std::invalid_argument("sim rate must be > 0");
    return std::chrono::nanoseconds(static_cast<int64_t>(1e9 / rate_hz));
}

} // namespace

SimTransport::SimTransport(double rate_hz)
    : rate_hz_(rate_hz),
      period_(tick_period(rate_hz)),
      rng_(std::random_device{}()) {}

void SimTransport::open() {
    started_ = MonoClock::now();
    next_tick_ = started_;
    pending_.clear();
    pending_off_ = 0;
    open_ = true;
}

std::size_t SimTransport::read_some(uint8_t* buf, std::size_t len,
                                    std::chrono::milliseconds timeout) {
    if (!open_) throw std::runtime_error("sim link not open");

    if (pending_off_ >= pending_.size()) {
        auto now = MonoClock::now();
        if (now < next_tick_) {
            auto wait = std::min<MonoClock::duration>(next_tick_ - now, timeout);
            std::this_thread::sleep_for(wait);
            if (MonoClock::now() < next_tick_) return 0;
        }
        pending_.clear();
        pending_off_ = 0;
        generate_tick();

        next_tick_ += period_;
        now = MonoClock::now();
        if (next_tick_ < now) next_tick_ = now + period_;
    }

    const std::size_t n = std::min(len, pending_.size() - pending_off_);
    std::memcpy(buf, pending_.data() + pending_off_, n);
    pending_off_ += n;
    return n;
}

void SimTransport::close() {
    open_ = false;
}

std::string SimTransport::describe() const {
    std::ostringstream o;
    o << "sim:" << rate_hz_;
    return o.str();
}

void SimTransport::append(const mavlink_message_t& msg) {
    auto frame = mavlink::to_wire(msg);
    pending_.insert(pending_.end(), frame.begin(), frame.end());
}

void SimTransport::generate_tick() {
    std::uniform_real_distribution<double> drift(-0.00005, 0.00005);
    std::uniform_real_distribution<double> climb(-0.5, 0.5);
    std::uniform_real_distribution<double> turn(-2.0, 2.0);
    std::uniform_real_distribution<double> tilt(-5.0, 5.0);
    std::uniform_real_distribution<double> volts(11.8, 12.6);
    std::uniform_real_distribution<double> amps(7.0, 15.0);
    std::uniform_int_distribution<int> sats(10, 15);

    lat_ += drift(rng_);
    lon_ += drift(rng_);
    alt_ = std::max(0.0, alt_ + climb(rng_));
    yaw_ = std::fmod(yaw_ + turn(rng_) + 360.0, 360.0);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        MonoClock::now() - started_);
    const auto boot_ms = static_cast<uint32_t>(elapsed.count());
    const auto elapsed_s = static_cast<double>(elapsed.count()) / 1000.0;

    const auto lat_e7 = static_cast<int32_t>(std::lround(lat_ * 1e7));
    const auto lon_e7 = static_cast<int32_t>(std::lround(lon_ * 1e7));
    const auto rel_mm = static_cast<int32_t>(std::lround(alt_ * 1000.0));
    const auto amsl_mm = static_cast<int32_t>(std::lround((alt_ + kHomeAltitudeM) * 1000.0));

    // ATTITUDE yaw is -pi..pi.
    const double yaw_signed = yaw_ > 180.0 ? yaw_ - 360.0 : yaw_;

    mavlink_message_t msg;

    mavlink_heartbeat_t hb{};
    hb.type          = MAV_TYPE_QUADROTOR;
    hb.autopilot     = MAV_AUTOPILOT_ARDUPILOTMEGA;
    hb.base_mode     = MAV_MODE_FLAG_SAFETY_ARMED | MAV_MODE_FLAG_CUSTOM_MODE_ENABLED;
    hb.custom_mode   = COPTER_MODE_GUIDED;
    hb.system_status = MAV_STATE_ACTIVE;
    mavlink_msg_heartbeat_encode_chan(kSysId, kCompId, kChannel, &msg, &hb);
    append(msg);

    mavlink_global_position_int_t pos{};
    pos.time_boot_ms = boot_ms;
    pos.lat          = lat_e7;
    pos.lon          = lon_e7;
    pos.alt          = amsl_mm;
    pos.relative_alt = rel_mm;
    pos.hdg          = static_cast<uint16_t>(yaw_ * 100.0);
    mavlink_msg_global_position_int_encode_chan(kSysId, kCompId, kChannel, &msg, &pos);
    append(msg);

    mavlink_attitude_t att{};
    att.time_boot_ms = boot_ms;
    att.roll         = static_cast<float>(tilt(rng_) * kDegToRad);
    att.pitch        = static_cast<float>(tilt(rng_) * kDegToRad);
    att.yaw          = static_cast<float>(yaw_signed * kDegToRad);
    mavlink_msg_attitude_encode_chan(kSysId, kCompId, kChannel, &msg, &att);
    append(msg);

    mavlink_sys_status_t st{};
    st.voltage_battery   = static_cast<uint16_t>(volts(rng_) * 1000.0);
    st.current_battery   = static_cast<int16_t>(amps(rng_) * 100.0);
    st.battery_remaining = static_cast<int8_t>(90.0 - std::fmod(elapsed_s, 600.0) / 10.0);
    mavlink_msg_sys_status_encode_chan(kSysId, kCompId, kChannel, &msg, &st);
    append(msg);

    mavlink_gps_raw_int_t gps{};
    gps.lat                = lat_e7;
    gps.lon                = lon_e7;
    gps.alt                = amsl_mm;
    gps.eph                = UINT16_MAX;
    gps.epv                = UINT16_MAX;
    gps.vel                = UINT16_MAX;
    gps.cog                = UINT16_MAX;
    gps.fix_type           = GPS_FIX_TYPE_RTK_FIXED;
    gps.satellites_visible = static_cast<uint8_t>(sats(rng_));
    mavlink_msg_gps_raw_int_encode_chan(kSysId, kCompId, kChannel, &msg, &gps);
    append(msg);
}

} // namespace skybridge
