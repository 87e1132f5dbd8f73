#pragma once

#include "skybridge/hub/BroadcastHub.hpp"
#include "skybridge/runtime/Config.hpp"
#include "skybridge/state/StateStore.hpp"

namespace skybridge {

// Single owner of the process's shared state. Constructed once in main();
// components receive references to the parts they use.
struct Context {
    explicit Context(const Config& cfg)
        : config(cfg), hub(cfg.queue_depth) {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const Config config;

    // Latest snapshot. Written only by the LinkReader.
    StateStore store;

    // Push subscribers.
    BroadcastHub hub;
};

} // namespace skybridge
