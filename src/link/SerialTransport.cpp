#include "skybridge/link/SerialTransport.hpp"

#include <utility>

namespace asio = boost::asio;

namespace skybridge {

SerialTransport::SerialTransport(std::string device, unsigned baud)
    : device_(std::move(device)), baud_(baud), port_(ioc_) {}

void SerialTransport::open() {
    port_.open(device_);
    port_.set_option(asio::serial_port_base::baud_rate(baud_));
    port_.set_option(asio::serial_port_base::character_size(8));
    port_.set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none));
    port_.set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one));
    port_.set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none));
}

std::size_t SerialTransport::read_some(uint8_t* buf, std::size_t len,
                                       std::chrono::milliseconds timeout) {
    boost::system::error_code result;
    std::size_t received = 0;
    bool done = false;

    port_.async_read_some(asio::buffer(buf, len),
        [&](const boost::system::error_code& ec, std::size_t n) {
            result = ec;
            received = n;
            done = true;
        });

    ioc_.restart();
    ioc_.run_for(timeout);

    if (!done) {
        port_.cancel();
        ioc_.restart();
        ioc_.run();
    }

    if (result == asio::error::operation_aborted) return 0;
    // Unplugged USB radios show up as EOF or EIO here.
    if (result) throw boost::system::system_error(result, "serial read " + device_);
    return received;
}

void SerialTransport::close() {
    boost::system::error_code ec;
    port_.close(ec);
}

std::string SerialTransport::describe() const {
    return "serial:" + device_ + ":" + std::to_string(baud_);
}

} // namespace skybridge
