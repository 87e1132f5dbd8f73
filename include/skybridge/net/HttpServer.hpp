#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "skybridge/api/SnapshotApi.hpp"
#include "skybridge/hub/BroadcastHub.hpp"

namespace skybridge {

struct HttpServerOptions {
    std::string address{"0.0.0.0"};
    uint16_t    port{8000};          // 0 picks a free port, see port()
    unsigned    threads{2};
    std::string static_root;         // serves <root>/index.html at "/"
    std::string tls_cert;            // PEM chain; empty = plain HTTP
    std::string tls_key;
};

// ---------------------------------------------------------------------------
// Dashboard-facing server (Boost.Beast).
//
//   GET /api/telemetry   pull the latest snapshot (503 before the first)
//   GET /api/health      link state, snapshot age, subscriber count
//   GET /ws/telemetry    WebSocket push stream
//   GET /                static dashboard page
//
// Every push client is a BroadcastHub subscriber whose queue is drained by
// its own session on its own strand.
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(HttpServerOptions opts, const SnapshotApi& api, BroadcastHub& hub);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts the I/O threads. Throws if the address cannot be
    // bound or the TLS material cannot be loaded.
    void start();

    // Stops accepting, gives push sessions a moment to finish their close
    // handshake, then stops the I/O threads. Close subscribers first
    // (BroadcastHub::close_all) for a clean WebSocket close.
    void stop();

    uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace skybridge
