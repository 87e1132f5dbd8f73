#include "skybridge/hub/BroadcastHub.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace skybridge {

BroadcastHub::BroadcastHub(std::size_t queue_depth)
    : depth_(queue_depth) {
    if (depth_ == 0) throw std::invalid_argument("subscriber queue depth must be > 0");
}

std::shared_ptr<Subscription> BroadcastHub::subscribe(Subscription::Notify on_ready,
                                                      Subscription::Notify on_closed) {
    std::shared_ptr<Subscription> sub;
    bool primed = false;
    bool refused = false;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        sub = std::make_shared<Subscription>(next_id_++, depth_,
                                             std::move(on_ready), std::move(on_closed));
        if (shut_down_) {
            refused = true;
        } else {
            if (latest_) primed = sub->offer(latest_) == Subscription::Offer::Queued;
            subs_.emplace(sub->id(), sub);
        }
    }

    if (refused) {
        sub->close(CloseReason::Shutdown);
        return sub;
    }
    if (primed) sub->notify_ready();
    return sub;
}

void BroadcastHub::unsubscribe(uint64_t id) {
    std::shared_ptr<Subscription> sub;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = subs_.find(id);
        if (it == subs_.end()) return;
        sub = std::move(it->second);
        subs_.erase(it);
    }
    sub->close(CloseReason::Unsubscribed);
}

void BroadcastHub::publish(SnapshotPtr snap) {
    if (!snap) return;

    std::vector<std::shared_ptr<Subscription>> ready;
    std::vector<std::shared_ptr<Subscription>> overflowed;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (shut_down_) return;
        latest_ = snap;

        ready.reserve(subs_.size());
        for (auto it = subs_.begin(); it != subs_.end();) {
            switch (it->second->offer(snap)) {
            case Subscription::Offer::Queued:
                ready.push_back(it->second);
                ++it;
                break;
            case Subscription::Offer::Full:
                overflowed.push_back(std::move(it->second));
                it = subs_.erase(it);
                break;
            case Subscription::Offer::Closed:
                it = subs_.erase(it);
                break;
            }
        }
    }

    // Consumers are woken and slow ones closed outside the hub lock.
    for (auto& sub : ready) sub->notify_ready();

    for (auto& sub : overflowed) {
        if (sub->close(CloseReason::Overflow)) {
            dropped_.fetch_add(1);
            std::cout << "[HUB] Dropped subscriber " << sub->id()
                      << " (queue full at " << sub->capacity() << ")\n";
        }
    }
}

void BroadcastHub::close_all() {
    std::unordered_map<uint64_t, std::shared_ptr<Subscription>> subs;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        shut_down_ = true;
        subs.swap(subs_);
    }
    for (auto& kv : subs) kv.second->close(CloseReason::Shutdown);
    if (!subs.empty()) {
        std::cout << "[HUB] Closed " << subs.size() << " subscriber(s)\n";
    }
}

std::size_t BroadcastHub::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return subs_.size();
}

} // namespace skybridge
