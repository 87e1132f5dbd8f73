#include "skybridge/link/UdpTransport.hpp"

#include <utility>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace skybridge {

UdpTransport::UdpTransport(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port), socket_(ioc_) {}

void UdpTransport::open() {
    const udp::endpoint local(asio::ip::make_address(host_), port_);
    socket_.open(local.protocol());
    socket_.set_option(asio::socket_base::reuse_address(true));
    socket_.bind(local);
}

std::size_t UdpTransport::read_some(uint8_t* buf, std::size_t len,
                                    std::chrono::milliseconds timeout) {
    boost::system::error_code result;
    std::size_t received = 0;
    bool done = false;

    socket_.async_receive_from(asio::buffer(buf, len), sender_,
        [&](const boost::system::error_code& ec, std::size_t n) {
            result = ec;
            received = n;
            done = true;
        });

    ioc_.restart();
    ioc_.run_for(timeout);

    if (!done) {
        // Timed out: cancel and let the handler complete before buf goes away.
        socket_.cancel();
        ioc_.restart();
        ioc_.run();
    }

    if (result == asio::error::operation_aborted) return 0;
    if (result) throw boost::system::system_error(result, "udp receive");
    return received;
}

void UdpTransport::close() {
    boost::system::error_code ec;
    socket_.close(ec);
}

std::string UdpTransport::describe() const {
    return "udp:" + host_ + ":" + std::to_string(port_);
}

} // namespace skybridge
