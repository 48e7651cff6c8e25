#include "WakeService.hpp"
#include <spdlog/spdlog.h>
#include "ConfigError.hpp"
#include "HostList.hpp"

std::string name_for(WakeRequestResult result) {
    switch (result) {
        case WakeRequestResult::Sent: return "wake signal sent";
        case WakeRequestResult::AlreadyOnline: return "already online";
        case WakeRequestResult::UnknownHost: return "unknown host";
        case WakeRequestResult::InvalidAddress: return "invalid hardware address";
        case WakeRequestResult::SendFailed: return "send failed";
    }
    return "unknown";
}

bool succeeded(WakeRequestResult result) {
    return result == WakeRequestResult::Sent || result == WakeRequestResult::AlreadyOnline;
}

WakeService::WakeService(HostRegistry& registry, WakeSender& sender, std::string hosts_path, ClockFn clock)
    : registry_(registry), sender_(sender), hosts_path_(std::move(hosts_path)), clock_(std::move(clock)) {}

std::vector<HostView> WakeService::all_statuses() const {
    return registry_.statuses(clock_());
}

WakeRequestResult WakeService::request_wake(const std::string& id) {
    auto host = registry_.find(id);
    if (!host) {
        spdlog::error("wake requested for unknown host {}", id);
        return WakeRequestResult::UnknownHost;
    }
    if (host->status.current() == HostState::Online) {
        spdlog::info("host {} is already online, not waking", id);
        return WakeRequestResult::AlreadyOnline;
    }

    const std::string mac = host->hardware_address.to_string();
    spdlog::info("sending wake signal to host {} ({})", id, mac);
    switch (sender_.wake(host->hardware_address)) {
        case WakeResult::Sent:
            spdlog::info("magic packet sent to {}", mac);
            return WakeRequestResult::Sent;
        case WakeResult::InvalidAddress:
            return WakeRequestResult::InvalidAddress;
        case WakeResult::SendFailed:
            break;
    }
    spdlog::error("failed to send magic packet to {}", mac);
    return WakeRequestResult::SendFailed;
}

bool WakeService::reload() {
    try {
        auto entries = HostList::load(hosts_path_);
        registry_.replace(entries, clock_());
        spdlog::info("reloaded {} hosts from {}", entries.size(), hosts_path_);
        return true;
    } catch (const ConfigError& ex) {
        spdlog::error("host list reload failed, keeping current hosts: {}", ex.what());
        return false;
    }
}
