#include "Engine.hpp"
#include <spdlog/spdlog.h>
#include "HostList.hpp"
#include "PortProbe.hpp"

Engine::Engine(const Config& cfg)
    : cfg_(cfg),
      registry_(cfg.time_wait, cfg.stale_after),
      sender_(cfg.wol_port, cfg.broadcast_address),
      scanner_(registry_,
               [port = cfg.check_port, timeout = cfg.probe_timeout](const std::string& address) {
                   return probe_port(address, port, timeout);
               },
               cfg.num_scan_threads, cfg.scan_interval),
      service_(registry_, sender_, cfg.computers_list) {}

Engine::~Engine() {
    stop();
}

bool Engine::start() {
    auto entries = HostList::load(cfg_.computers_list);
    registry_.replace(entries, HostClock::now());
    spdlog::info("loaded {} hosts from {}", entries.size(), cfg_.computers_list);

    if (!sender_.init(cfg_.broadcast_interface)) {
        spdlog::error("wake sender init failed");
        return false;
    }
    spdlog::info("wake signals go to {}:{}", sender_.broadcast_address(), sender_.port());

    if (!scanner_.start()) {
        spdlog::error("scanner did not start");
        return false;
    }
    spdlog::info("scanning port {} with {} threads every {}s", cfg_.check_port, scanner_.thread_count(),
                 cfg_.scan_interval.count());
    return true;
}

void Engine::stop() {
    scanner_.stop();
    sender_.close();
}
