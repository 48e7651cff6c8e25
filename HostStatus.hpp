#ifndef HOST_STATUS_HPP
#define HOST_STATUS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <variant>

using HostClock = std::chrono::steady_clock;

enum class HostState {
    Online,
    Offline,
    Pending
};

std::string name_for(HostState state);

// Debounced reachability of a single host. A raw probe result only becomes
// the visible state after it has held for time_wait; a disagreeing probe
// before that cancels the transition.
class HostStatus {
public:
    struct Stable {
        HostState state;
    };

    // previous is empty until the first transition has been committed
    struct Pending {
        HostState target;
        std::optional<HostState> previous;
        HostClock::time_point since;
    };

    using Phase = std::variant<Stable, Pending>;

    struct Probe {
        HostClock::time_point at;
        bool reachable;
    };

    // Starts as Pending(Offline) with no previous state.
    explicit HostStatus(HostClock::time_point now);

    // Feeds one probe result. Returns true when it committed a transition.
    bool apply(bool reachable, HostClock::time_point now, std::chrono::seconds time_wait);

    HostState current() const;
    bool is_pending() const { return std::holds_alternative<Pending>(phase_); }
    const Phase& phase() const { return phase_; }

    const std::optional<HostClock::time_point>& last_change() const { return last_change_; }
    const std::optional<Probe>& last_probe() const { return last_probe_; }

private:
    Phase phase_;
    std::optional<HostClock::time_point> last_change_;
    std::optional<Probe> last_probe_;
};

#endif // HOST_STATUS_HPP
