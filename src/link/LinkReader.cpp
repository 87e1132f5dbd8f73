#include "skybridge/link/LinkReader.hpp"
#include "skybridge/mavlink/MavlinkMessages.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace skybridge {

namespace {

// Upper bound on one blocking read, so shutdown and silence are noticed.
constexpr auto kReadSlice = std::chrono::milliseconds(200);
constexpr auto kSleepSlice = std::chrono::milliseconds(50);

} // namespace

LinkReader::LinkReader(StateStore& store, BroadcastHub& hub,
                       TransportFactory factory, LinkReaderOptions opts)
    : store_(store),
      hub_(hub),
      factory_(std::move(factory)),
      opts_(opts),
      backoff_(opts.backoff_initial, opts.backoff_max) {
    if (!factory_) throw std::invalid_argument("link reader needs a transport factory");
}

LinkStatus LinkReader::status() const {
    LinkStatus s;
    s.state      = link_.state();
    s.frames     = frames_.load();
    s.bad_frames = bad_frames_.load();
    s.snapshots  = snapshots_.load();
    s.connects   = link_.connects();
    return s;
}

void LinkReader::run(std::atomic<bool>& running) {
    while (running.load()) {
        link_.begin_connect();

        std::string where = "link";
        try {
            auto transport = factory_();
            where = transport->describe();
            std::cout << "[LINK] Connecting (" << where << ")\n";

            transport->open();
            session(*transport, running);
            transport->close();
        } catch (const std::exception& e) {
            if (!running.load()) break;

            const bool have_snapshot = store_.get() != nullptr;
            link_.on_failure(have_snapshot);
            const auto delay = backoff_.next();
            std::cout << "[LINK] Lost " << where << " (" << e.what() << "), state="
                      << to_string(link_.state()) << ", retry in " << delay.count() << " ms\n";
            sleep_backoff(delay, running);
        }
    }

    if (link_.shutdown()) std::cout << "[LINK] Stopped\n";
}

void LinkReader::session(LinkTransport& transport, std::atomic<bool>& running) {
    mavlink::FrameParser parser;
    std::array<uint8_t, 2048> buf{};
    auto last_valid = MonoClock::now();
    const auto slice = std::min(opts_.timeout, std::chrono::milliseconds(kReadSlice));

    while (running.load()) {
        const std::size_t n = transport.read_some(buf.data(), buf.size(), slice);

        if (n > 0) {
            frames_buf_.clear();
            parser.feed(buf.data(), n, frames_buf_);
            bad_frames_.fetch_add(parser.take_bad_frames());

            for (const auto& frame : frames_buf_) {
                if (handle_frame(frame)) last_valid = MonoClock::now();
            }
        }

        const auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(
            MonoClock::now() - last_valid);
        if (silent > opts_.timeout) {
            throw std::runtime_error("no valid frame for " + std::to_string(silent.count()) + " ms");
        }
    }
}

bool LinkReader::handle_frame(const mavlink_message_t& msg) {
    auto update = mavlink::decode(msg);
    if (!update) return false;

    frames_.fetch_add(1);
    if (link_.on_frame()) {
        backoff_.reset();
        std::cout << "[LINK] Connected (sysid=" << static_cast<int>(msg.sysid)
                  << ", mavlink v" << mavlink::version_of(msg)
                  << ", connect #" << link_.connects() << ")\n";
    }

    apply(*update);
    return true;
}

SnapshotPtr LinkReader::apply(const TelemetryUpdate& update) {
    if (!has_any(update)) return nullptr;

    SnapshotPtr prev = store_.get();
    auto next = std::make_shared<const TelemetrySnapshot>(
        merge_snapshot(prev.get(), update, ++seq_, wall_clock_ms(), MonoClock::now()));

    store_.replace(next);
    hub_.publish(next);
    snapshots_.fetch_add(1);
    return next;
}

void LinkReader::sleep_backoff(std::chrono::milliseconds delay, std::atomic<bool>& running) {
    const auto until = MonoClock::now() + delay;
    while (running.load()) {
        const auto now = MonoClock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<MonoClock::duration>(until - now, kSleepSlice));
    }
}

} // namespace skybridge
