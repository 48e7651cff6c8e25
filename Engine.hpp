#ifndef ENGINE_HPP
#define ENGINE_HPP

#include "Config.hpp"
#include "HostRegistry.hpp"
#include "Scanner.hpp"
#include "WakeSender.hpp"
#include "WakeService.hpp"

// Wires registry, scanner, sender and service together from one Config.
class Engine {
public:
    explicit Engine(const Config& cfg);
    ~Engine();

    // Loads the host list, opens the broadcast socket and starts scanning.
    // Throws ConfigError on a bad host list; returns false when the sender
    // could not be initialized.
    bool start();
    void stop();

    HostRegistry& registry() { return registry_; }
    Scanner& scanner() { return scanner_; }
    WakeService& service() { return service_; }
    const Config& config() const { return cfg_; }

private:
    Config cfg_;
    HostRegistry registry_;
    WakeSender sender_;
    Scanner scanner_;
    WakeService service_;
};

#endif // ENGINE_HPP
