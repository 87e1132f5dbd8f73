#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace skybridge {

// Byte pipe to the flight controller. Implementations throw
// std::exception (usually boost::system::system_error) on I/O failure; the
// link reader treats any throw as a lost connection.
class LinkTransport {
public:
    virtual ~LinkTransport() = default;

    virtual void open() = 0;

    // Waits up to timeout for data. Returns the byte count, 0 on timeout.
    virtual std::size_t read_some(uint8_t* buf, std::size_t len,
                                  std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<LinkTransport>()>;

} // namespace skybridge
