#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

#include "skybridge/hub/BroadcastHub.hpp"
#include "skybridge/link/LinkStateMachine.hpp"
#include "skybridge/link/LinkTransport.hpp"
#include "skybridge/link/ReconnectBackoff.hpp"
#include "skybridge/mavlink/MavlinkFrame.hpp"
#include "skybridge/state/StateStore.hpp"

namespace skybridge {

struct LinkReaderOptions {
    // No valid frame for this long counts as a lost link.
    std::chrono::milliseconds timeout{3000};
    std::chrono::milliseconds backoff_initial{250};
    std::chrono::milliseconds backoff_max{8000};
};

struct LinkStatus {
    LinkState state{LinkState::Disconnected};
    uint64_t frames{0};
    uint64_t bad_frames{0};
    uint64_t snapshots{0};
    uint64_t connects{0};
};

// ---------------------------------------------------------------------------
// Owns the telemetry link. run() is the connection loop: open the transport,
// decode frames, merge each update into a new snapshot, store it, publish it.
// Any transport failure or link silence moves the link to Degraded (the
// stored snapshot is left alone) and the loop reconnects after backoff.
// run() returns only when running goes false.
//
// The reader is the only writer of the StateStore.
// ---------------------------------------------------------------------------
class LinkReader {
public:
    LinkReader(StateStore& store, BroadcastHub& hub,
               TransportFactory factory, LinkReaderOptions opts = {});

    void run(std::atomic<bool>& running);

    // Merges one decoded update and publishes the result. Returns the new
    // snapshot, or null when the update carried no field.
    SnapshotPtr apply(const TelemetryUpdate& update);

    LinkState state() const { return link_.state(); }
    LinkStatus status() const;

private:
    void session(LinkTransport& transport, std::atomic<bool>& running);
    bool handle_frame(const mavlink_message_t& msg);
    void sleep_backoff(std::chrono::milliseconds delay, std::atomic<bool>& running);

    StateStore&       store_;
    BroadcastHub&     hub_;
    TransportFactory  factory_;
    LinkReaderOptions opts_;

    LinkStateMachine  link_;
    ReconnectBackoff  backoff_;

    uint64_t seq_{0};
    std::vector<mavlink_message_t> frames_buf_;

    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> bad_frames_{0};
    std::atomic<uint64_t> snapshots_{0};
};

} // namespace skybridge
