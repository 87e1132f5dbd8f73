#pragma once

#include <cstdint>
#include <string>

#include "skybridge/link/LinkTransport.hpp"

namespace skybridge {

// Link address forms:
//   udp:<bind-host>:<port>        listen for MAVLink datagrams
//   serial:<device>[:<baud>]      serial / USB telemetry radio, default 57600
//   sim[:<rate_hz>]               built-in simulated vehicle, default 2 Hz
struct LinkUri {
    enum class Kind { Udp, Serial, Sim };

    Kind        kind{Kind::Udp};
    std::string host;
    uint16_t    port{0};
    std::string device;
    unsigned    baud{57600};
    double      rate_hz{2.0};

    std::string to_string() const;
};

// Throws std::invalid_argument on a malformed address.
LinkUri parse_link_uri(const std::string& uri);

TransportFactory make_transport_factory(const LinkUri& uri);

} // namespace skybridge
