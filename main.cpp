#include "Config.hpp"
#include "ConfigError.hpp"
#include "Engine.hpp"
#include "Logging.hpp"
#include "UI.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>

static std::atomic<bool> g_terminate(false);
static std::atomic<bool> g_reload(false);

// Signal handlers set a flag only (async-signal-safe)
void stop_handler(int) {
    g_terminate.store(true);
}

void reload_handler(int) {
    g_reload.store(true);
}

static void run_headless(Engine& engine) {
    while (!g_terminate.load()) {
        if (g_reload.exchange(false)) engine.service().reload();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int main(int argc, char* argv[]) {
    Options opts;
    Config cfg;
    try {
        opts = parse_options(argc, argv, true);
        if (opts.help) {
            std::cout << "Usage: lanwake [options]\n" << opts.usage;
            return 0;
        }
        cfg = load_config(opts.config_path);
        if (!opts.log_level.empty()) cfg.log_level = opts.log_level;
        init_logging(cfg.log_file, cfg.log_level, opts.headless);
    } catch (const ConfigError& ex) {
        std::cerr << "lanwake: " << ex.what() << "\n";
        return 1;
    }

    spdlog::info("Service starting (config {})", opts.config_path);
    Engine engine(cfg);
    try {
        if (!engine.start()) {
            std::cerr << "Wake sender init failed\n";
            return 2;
        }
    } catch (const ConfigError& ex) {
        spdlog::critical("{}", ex.what());
        std::cerr << "lanwake: " << ex.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);
    std::signal(SIGHUP, reload_handler);

    if (opts.headless) {
        run_headless(engine);
    } else {
        UI ui(engine.service(), engine.scanner());
        if (!ui.init()) {
            std::cerr << "UI init failed, running headless\n";
            run_headless(engine);
        } else {
            ui.run(g_terminate, g_reload);
        }
    }

    spdlog::info("Service stopping");
    engine.stop();
    return 0;
}
