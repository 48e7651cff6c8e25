#include "HostRegistry.hpp"
#include <mutex>
#include "ConfigError.hpp"

std::string state_label(const HostView& view) {
    if (view.stale) return "checking";
    return name_for(view.state);
}

HostRegistry::HostRegistry(std::chrono::seconds time_wait, std::chrono::seconds stale_after)
    : time_wait_(time_wait), stale_after_(stale_after) {}

void HostRegistry::replace(const std::vector<HostEntry>& entries, HostClock::time_point now) {
    std::unordered_map<std::string, HostRecord> hosts;
    std::vector<std::string> order;
    hosts.reserve(entries.size());
    order.reserve(entries.size());
    for (const auto& e : entries) {
        HostRecord record{e.id, e.display_name, e.hardware_address, HostStatus(now)};
        if (!hosts.emplace(e.id, std::move(record)).second) {
            throw ConfigError("duplicate host id '" + e.id + "'");
        }
        order.push_back(e.id);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    hosts_.swap(hosts);
    order_.swap(order);
    last_scan_.reset();
}

std::optional<HostState> HostRegistry::apply_probe(const std::string& id, bool reachable, HostClock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = hosts_.find(id);
    if (it == hosts_.end()) return std::nullopt;
    if (!it->second.status.apply(reachable, now, time_wait_)) return std::nullopt;
    return it->second.status.current();
}

void HostRegistry::mark_scan_complete(HostClock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    last_scan_ = now;
}

std::vector<std::string> HostRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return order_;
}

std::optional<HostRecord> HostRegistry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = hosts_.find(id);
    if (it == hosts_.end()) return std::nullopt;
    return it->second;
}

std::vector<HostView> HostRegistry::statuses(HostClock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const bool stale = !last_scan_ || now - *last_scan_ > stale_after_;

    std::vector<HostView> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        const HostRecord& r = hosts_.at(id);
        out.push_back({r.id, r.display_name, r.hardware_address, r.status.current(), stale,
                       r.status.last_change()});
    }
    return out;
}

std::optional<HostClock::time_point> HostRegistry::last_scan() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_scan_;
}

std::size_t HostRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hosts_.size();
}
