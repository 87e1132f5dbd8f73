#include "skybridge/hub/Subscription.hpp"

#include <utility>

namespace skybridge {

const char* to_string(CloseReason r) {
    switch (r) {
    case CloseReason::None:         return "none";
    case CloseReason::Unsubscribed: return "unsubscribed";
    case CloseReason::Overflow:     return "overflow";
    case CloseReason::Shutdown:     return "shutdown";
    }
    return "unknown";
}

Subscription::Subscription(uint64_t id, std::size_t capacity, Notify on_ready, Notify on_closed)
    : id_(id),
      capacity_(capacity),
      on_ready_(std::move(on_ready)),
      on_closed_(std::move(on_closed)) {}

Subscription::Offer Subscription::offer(SnapshotPtr snap) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (reason_ != CloseReason::None) return Offer::Closed;
        if (queue_.size() >= capacity_) return Offer::Full;
        queue_.push_back(std::move(snap));
    }
    return Offer::Queued;
}

SnapshotPtr Subscription::try_pop() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return nullptr;
    SnapshotPtr s = std::move(queue_.front());
    queue_.pop_front();
    return s;
}

bool Subscription::close(CloseReason reason) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (reason_ != CloseReason::None) return false;
        reason_ = reason;
        // Undelivered snapshots are released with the subscriber.
        queue_.clear();
    }
    if (on_closed_) on_closed_();
    return true;
}

bool Subscription::alive() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return reason_ == CloseReason::None;
}

CloseReason Subscription::close_reason() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return reason_;
}

std::size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
}

void Subscription::notify_ready() const {
    if (on_ready_) on_ready_();
}

} // namespace skybridge
