#pragma once

#include <string>

#include <boost/asio.hpp>

#include "skybridge/link/LinkTransport.hpp"

namespace skybridge {

// Listens for MAVLink datagrams (autopilot or mavlink-router pushing to us).
class UdpTransport : public LinkTransport {
public:
    UdpTransport(std::string host, uint16_t port);

    void open() override;
    std::size_t read_some(uint8_t* buf, std::size_t len,
                          std::chrono::milliseconds timeout) override;
    void close() override;
    std::string describe() const override;

private:
    std::string host_;
    uint16_t port_;

    boost::asio::io_context ioc_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint sender_;
};

} // namespace skybridge
