#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "skybridge/hub/Subscription.hpp"
#include "skybridge/telemetry/TelemetrySnapshot.hpp"

namespace skybridge {

// ---------------------------------------------------------------------------
// Fan-out of published snapshots to push subscribers.
//
// publish() and subscribe() are serialised by one mutex, and a subscriber's
// first item is the latest snapshot published before it joined. Every
// subscriber therefore sees the same gap-free suffix of the publish order.
//
// Backpressure: each subscriber has a bounded queue. A subscriber whose queue
// is full when a snapshot is offered is closed (CloseReason::Overflow) and
// removed; publish() never waits on a consumer.
// ---------------------------------------------------------------------------
class BroadcastHub {
public:
    explicit BroadcastHub(std::size_t queue_depth);

    std::shared_ptr<Subscription> subscribe(Subscription::Notify on_ready = {},
                                            Subscription::Notify on_closed = {});

    // Safe to call concurrently with publish(), and more than once.
    void unsubscribe(uint64_t id);

    void publish(SnapshotPtr snap);

    // Closes every subscriber with CloseReason::Shutdown. Later subscribe()
    // calls return an already-closed subscription.
    void close_all();

    std::size_t size() const;
    std::size_t queue_depth() const { return depth_; }
    uint64_t dropped() const { return dropped_.load(); }

private:
    const std::size_t depth_;

    mutable std::mutex mtx_;
    std::unordered_map<uint64_t, std::shared_ptr<Subscription>> subs_;
    SnapshotPtr latest_;
    uint64_t next_id_{1};
    bool shut_down_{false};

    std::atomic<uint64_t> dropped_{0};
};

} // namespace skybridge
