#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

#include "skybridge/telemetry/TelemetrySnapshot.hpp"

namespace skybridge {

enum class CloseReason : uint8_t {
    None,
    Unsubscribed,   // client went away / send failed
    Overflow,       // could not keep up, dropped by the hub
    Shutdown,       // process is stopping
};

const char* to_string(CloseReason r);

// ---------------------------------------------------------------------------
// One push client's bounded delivery queue.
//
// Producer side (hub): offer() never blocks; a full queue is reported back
// so the hub can drop the subscriber. Consumer side (the client's own send
// path): try_pop() from its event loop after on_ready.
//
// on_ready / on_closed run on the producer's thread, outside any lock. They
// must hand work off (post to an executor, notify) and return.
// ---------------------------------------------------------------------------
class Subscription {
public:
    using Notify = std::function<void()>;

    enum class Offer { Queued, Full, Closed };

    Subscription(uint64_t id, std::size_t capacity, Notify on_ready, Notify on_closed);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    uint64_t id() const { return id_; }
    std::size_t capacity() const { return capacity_; }

    Offer offer(SnapshotPtr snap);

    SnapshotPtr try_pop();

    // First close wins; returns false if already closed.
    bool close(CloseReason reason);

    bool alive() const;
    CloseReason close_reason() const;
    std::size_t pending() const;

    void notify_ready() const;

private:
    const uint64_t id_;
    const std::size_t capacity_;
    const Notify on_ready_;
    const Notify on_closed_;

    mutable std::mutex mtx_;
    std::deque<SnapshotPtr> queue_;
    CloseReason reason_{CloseReason::None};
};

} // namespace skybridge
