#include "skybridge/link/LinkUri.hpp"
#include "skybridge/link/SerialTransport.hpp"
#include "skybridge/link/SimTransport.hpp"
#include "skybridge/link/UdpTransport.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace skybridge {

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

unsigned long parse_unsigned(const std::string& s, const std::string& what, const std::string& uri) {
    if (!all_digits(s) || s.size() > 9) {
        throw std::invalid_argument("bad " + what + " in link address '" + uri + "'");
    }
    return std::stoul(s);
}

} // namespace

std::string LinkUri::to_string() const {
    std::ostringstream o;
    switch (kind) {
    case Kind::Udp:
        if (host.find(':') != std::string::npos) o << "udp:[" << host << "]:" << port;
        else                                     o << "udp:" << host << ":" << port;
        break;
    case Kind::Serial:
        o << "serial:" << device << ":" << baud;
        break;
    case Kind::Sim:
        o << "sim:" << rate_hz;
        break;
    }
    return o.str();
}

LinkUri parse_link_uri(const std::string& uri) {
    const auto colon = uri.find(':');
    const std::string scheme = uri.substr(0, colon);
    const std::string rest = colon == std::string::npos ? std::string() : uri.substr(colon + 1);

    LinkUri out;

    if (scheme == "udp") {
        out.kind = LinkUri::Kind::Udp;
        const auto port_sep = rest.rfind(':');
        if (port_sep == std::string::npos) {
            throw std::invalid_argument("link address '" + uri + "' needs udp:<host>:<port>");
        }
        std::string host = rest.substr(0, port_sep);
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        if (host.empty()) {
            throw std::invalid_argument("empty host in link address '" + uri + "'");
        }
        const unsigned long port = parse_unsigned(rest.substr(port_sep + 1), "port", uri);
        if (port == 0 || port > 65535) {
            throw std::invalid_argument("port out of range in link address '" + uri + "'");
        }
        out.host = host;
        out.port = static_cast<uint16_t>(port);
        return out;
    }

    if (scheme == "serial") {
        out.kind = LinkUri::Kind::Serial;
        std::string device = rest;
        const auto baud_sep = rest.rfind(':');
        if (baud_sep != std::string::npos) {
            device = rest.substr(0, baud_sep);
            const unsigned long baud = parse_unsigned(rest.substr(baud_sep + 1), "baud rate", uri);
            if (baud == 0) {
                throw std::invalid_argument("zero baud rate in link address '" + uri + "'");
            }
            out.baud = static_cast<unsigned>(baud);
        }
        if (device.empty()) {
            throw std::invalid_argument("empty device in link address '" + uri + "'");
        }
        out.device = device;
        return out;
    }

    if (scheme == "sim") {
        out.kind = LinkUri::Kind::Sim;
        if (!rest.empty()) {
            try {
                std::size_t used = 0;
                out.rate_hz = std::stod(rest, &used);
                if (used != rest.size()) throw std::invalid_argument(rest);
            } catch (const std::exception&) {
                throw std::invalid_argument("bad rate in link address '" + uri + "'");
            }
            if (!(out.rate_hz > 0.0) || out.rate_hz > 1000.0) {
                throw std::invalid_argument("rate out of range in link address '" + uri + "'");
            }
        }
        return out;
    }

    throw std::invalid_argument("unknown link scheme in '" + uri + "' (udp, serial, sim)");
}

TransportFactory make_transport_factory(const LinkUri& uri) {
    switch (uri.kind) {
    case LinkUri::Kind::Udp:
        return [uri]() -> std::unique_ptr<LinkTransport> {
            return std::make_unique<UdpTransport>(uri.host, uri.port);
        };
    case LinkUri::Kind::Serial:
        return [uri]() -> std::unique_ptr<LinkTransport> {
            return std::make_unique<SerialTransport>(uri.device, uri.baud);
        };
    case LinkUri::Kind::Sim:
        break;
    }
    return [uri]() -> std::unique_ptr<LinkTransport> {
        return std::make_unique<SimTransport>(uri.rate_hz);
    };
}

} // namespace skybridge
