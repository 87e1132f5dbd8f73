#pragma once

#include <string>

#include <boost/asio.hpp>

#include "skybridge/link/LinkTransport.hpp"

namespace skybridge {

// Telemetry radio or USB autopilot on a tty, 8N1 without flow control.
class SerialTransport : public LinkTransport {
public:
    SerialTransport(std::string device, unsigned baud);

    void open() override;
    std::size_t read_some(uint8_t* buf, std::size_t len,
                          std::chrono::milliseconds timeout) override;
    void close() override;
    std::string describe() const override;

private:
    std::string device_;
    unsigned baud_;

    boost::asio::io_context ioc_;
    boost::asio::serial_port port_;
};

} // namespace skybridge
