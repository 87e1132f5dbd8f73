#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "skybridge/hub/BroadcastHub.hpp"
#include "skybridge/link/LinkReader.hpp"
#include "skybridge/state/StateStore.hpp"

namespace skybridge {

struct ApiResponse {
    unsigned    status{200};
    std::string body;           // always application/json
};

// Pull endpoints. Holds no state of its own; every call reads the store.
class SnapshotApi {
public:
    using StatusSource = std::function<LinkStatus()>;

    SnapshotApi(const StateStore& store,
                const BroadcastHub& hub,
                StatusSource link_status,
                std::chrono::milliseconds stale_after);

    // 200 + snapshot, or 503 {"error":"unavailable"} before the first one.
    ApiResponse snapshot(MonoTime now = MonoClock::now()) const;

    // Always 200.
    ApiResponse health(MonoTime now = MonoClock::now()) const;

    std::chrono::milliseconds stale_after() const { return stale_after_; }

private:
    const StateStore&         store_;
    const BroadcastHub&       hub_;
    StatusSource              link_status_;
    std::chrono::milliseconds stale_after_;
};

} // namespace skybridge
