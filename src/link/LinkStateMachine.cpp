#include "skybridge/link/LinkStateMachine.hpp"

namespace skybridge {

const char* to_string(LinkState s) {
    switch (s) {
    case LinkState::Disconnected: return "disconnected";
    case LinkState::Connecting:   return "connecting";
    case LinkState::Connected:    return "connected";
    case LinkState::Degraded:     return "degraded";
    }
    return "unknown";
}

bool LinkStateMachine::move(LinkState from, LinkState to) {
    return state_.compare_exchange_strong(from, to);
}

bool LinkStateMachine::begin_connect() {
    return move(LinkState::Disconnected, LinkState::Connecting) ||
           move(LinkState::Degraded, LinkState::Connecting);
}

bool LinkStateMachine::on_frame() {
    if (!move(LinkState::Connecting, LinkState::Connected)) return false;
    connects_.fetch_add(1);
    return true;
}

bool LinkStateMachine::on_failure(bool have_snapshot) {
    const LinkState to = have_snapshot ? LinkState::Degraded : LinkState::Disconnected;
    return move(LinkState::Connecting, to) || move(LinkState::Connected, to);
}

bool LinkStateMachine::shutdown() {
    return state_.exchange(LinkState::Disconnected) != LinkState::Disconnected;
}

} // namespace skybridge
