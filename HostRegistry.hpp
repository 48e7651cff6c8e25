#ifndef HOST_REGISTRY_HPP
#define HOST_REGISTRY_HPP

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "HardwareAddress.hpp"
#include "HostStatus.hpp"

// One row of the host list.
struct HostEntry {
    std::string id;
    std::string display_name;
    HardwareAddress hardware_address;
};

struct HostRecord {
    std::string id;
    std::string display_name;
    HardwareAddress hardware_address;
    HostStatus status;
};

// What front-ends render for one host.
struct HostView {
    std::string id;
    std::string display_name;
    HardwareAddress hardware_address;
    HostState state;
    // no scan cycle completed recently; the state may be out of date
    bool stale;
    std::optional<HostClock::time_point> last_change;
};

// Text shown for a host; a stale reading shows as "checking".
std::string state_label(const HostView& view);

// Owns the status of every managed host. The scanner is the only writer;
// any number of readers may call the const members concurrently.
class HostRegistry {
public:
    explicit HostRegistry(std::chrono::seconds time_wait,
                          std::chrono::seconds stale_after = std::chrono::seconds(900));

    // Replaces the whole host set; every host restarts in the initial state.
    // Throws ConfigError on a duplicate id and leaves the registry untouched.
    void replace(const std::vector<HostEntry>& entries, HostClock::time_point now);

    // Runs one probe result through the host's debounce state machine.
    // Returns the newly committed state, if any. Unknown ids are ignored.
    std::optional<HostState> apply_probe(const std::string& id, bool reachable, HostClock::time_point now);

    void mark_scan_complete(HostClock::time_point now);

    std::vector<std::string> ids() const;
    std::optional<HostRecord> find(const std::string& id) const;
    std::vector<HostView> statuses(HostClock::time_point now) const;
    std::optional<HostClock::time_point> last_scan() const;
    std::size_t size() const;

    std::chrono::seconds time_wait() const { return time_wait_; }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, HostRecord> hosts_;
    // host-list order, for display
    std::vector<std::string> order_;
    std::optional<HostClock::time_point> last_scan_;
    const std::chrono::seconds time_wait_;
    const std::chrono::seconds stale_after_;
};

#endif // HOST_REGISTRY_HPP
