#ifndef WAKE_SERVICE_HPP
#define WAKE_SERVICE_HPP

#include <functional>
#include <string>
#include <vector>
#include "HostRegistry.hpp"
#include "WakeSender.hpp"

enum class WakeRequestResult {
    Sent,
    AlreadyOnline,
    UnknownHost,
    InvalidAddress,
    SendFailed
};

std::string name_for(WakeRequestResult result);
bool succeeded(WakeRequestResult result);

// What the front-ends call: host statuses, wake requests by id and host
// list reloads.
class WakeService {
public:
    using ClockFn = std::function<HostClock::time_point()>;

    WakeService(HostRegistry& registry, WakeSender& sender, std::string hosts_path,
                ClockFn clock = &HostClock::now);

    std::vector<HostView> all_statuses() const;

    // A host that is already online is left alone and reported as success.
    WakeRequestResult request_wake(const std::string& id);

    // Replaces the registry from the host list file. On a malformed file the
    // current hosts are kept and false is returned.
    bool reload();

private:
    HostRegistry& registry_;
    WakeSender& sender_;
    std::string hosts_path_;
    ClockFn clock_;
};

#endif // WAKE_SERVICE_HPP
