#pragma once

#include <random>
#include <vector>

#include "skybridge/link/LinkTransport.hpp"
#include "skybridge/mavlink/MavlinkFrame.hpp"
#include "skybridge/telemetry/TelemetrySnapshot.hpp"

namespace skybridge {

// Simulated vehicle for bench work without an autopilot. Emits a burst of
// real MAVLink 2 frames (heartbeat, position, attitude, power, GPS) per tick:
// a slow random walk around a fixed start point, battery draining over ten
// minutes.
class SimTransport : public LinkTransport {
public:
    explicit SimTransport(double rate_hz);

    void open() override;
    std::size_t read_some(uint8_t* buf, std::size_t len,
                          std::chrono::milliseconds timeout) override;
    void close() override;
    std::string describe() const override;

private:
    void generate_tick();
    void append(const mavlink_message_t& msg);

    double rate_hz_;
    std::chrono::nanoseconds period_;
    MonoTime started_{};
    MonoTime next_tick_{};
    bool open_{false};

    std::mt19937 rng_;

    double lat_{33.7490};
    double lon_{-84.3880};
    double alt_{0.0};
    double yaw_{0.0};

    std::vector<uint8_t> pending_;
    std::size_t pending_off_{0};
};

} // namespace skybridge
