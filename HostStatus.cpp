#include "HostStatus.hpp"

std::string name_for(HostState state) {
    switch (state) {
        case HostState::Online: return "online";
        case HostState::Offline: return "offline";
        case HostState::Pending: return "pending";
    }
    return "unknown";
}

HostStatus::HostStatus(HostClock::time_point now)
    : phase_(Pending{HostState::Offline, std::nullopt, now}) {}

bool HostStatus::apply(bool reachable, HostClock::time_point now, std::chrono::seconds time_wait) {
    last_probe_ = Probe{now, reachable};
    const HostState observed = reachable ? HostState::Online : HostState::Offline;

    if (auto* stable = std::get_if<Stable>(&phase_)) {
        if (stable->state != observed) {
            phase_ = Pending{observed, stable->state, now};
        }
        return false;
    }

    auto& pending = std::get<Pending>(phase_);
    if (observed != pending.target) {
        if (pending.previous) {
            // flapped back before the wait elapsed
            phase_ = Stable{*pending.previous};
        } else {
            // nothing committed yet, so there is nothing to revert to
            phase_ = Pending{observed, std::nullopt, now};
        }
        return false;
    }

    if (now - pending.since < time_wait) return false;

    phase_ = Stable{pending.target};
    last_change_ = now;
    return true;
}

HostState HostStatus::current() const {
    if (auto* stable = std::get_if<Stable>(&phase_)) return stable->state;
    const auto& pending = std::get<Pending>(phase_);
    return pending.previous ? *pending.previous : HostState::Pending;
}
