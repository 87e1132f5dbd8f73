#pragma once

#include <atomic>
#include <cstdint>

namespace skybridge {

enum class LinkState : uint8_t {
    Disconnected,   // never produced telemetry (or shut down)
    Connecting,     // transport opening, or open but no valid frame yet
    Connected,      // valid frames flowing
    Degraded,       // link lost; last-known-good snapshot still served
};

const char* to_string(LinkState s);

// ---------------------------------------------------------------------------
// Link connection state. Transitions are driven only by transport I/O
// outcomes reported by the link reader. Each transition method returns true
// when the state actually changed so the caller can log it once.
//
//   Disconnected/Degraded --begin_connect--> Connecting
//   Connecting            --on_frame-------> Connected
//   Connecting/Connected  --on_failure-----> Degraded     (snapshot retained)
//                                          \-> Disconnected (nothing to retain)
//   any                   --shutdown-------> Disconnected
//
// state() may be read from any thread.
// ---------------------------------------------------------------------------
class LinkStateMachine {
public:
    LinkState state() const { return state_.load(); }

    bool begin_connect();
    bool on_frame();
    bool on_failure(bool have_snapshot);
    bool shutdown();

    uint64_t connects() const { return connects_.load(); }

private:
    bool move(LinkState from, LinkState to);

    std::atomic<LinkState> state_{LinkState::Disconnected};
    std::atomic<uint64_t> connects_{0};
};

} // namespace skybridge
