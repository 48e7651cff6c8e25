#include "Config.hpp"
#include "ConfigError.hpp"
#include "Engine.hpp"
#include "Logging.hpp"
#include "UIQt.hpp"
#include <QApplication>
#include <QTimer>
#include <spdlog/spdlog.h>
#include <iostream>
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

int main(int argc, char* argv[]) {
    Options opts;
    Config cfg;
    try {
        opts = parse_options(argc, argv, false);
        if (opts.help) {
            std::cout << "Usage: lanwake-qt [options]\n" << opts.usage;
            return 0;
        }
        cfg = load_config(opts.config_path);
        if (!opts.log_level.empty()) cfg.log_level = opts.log_level;
        init_logging(cfg.log_file, cfg.log_level, true);
    } catch (const ConfigError& ex) {
        std::cerr << "lanwake-qt: " << ex.what() << "\n";
        return 1;
    }

    QApplication app(argc, argv);

    spdlog::info("Service starting (config {})", opts.config_path);
    Engine engine(cfg);
    try {
        if (!engine.start()) {
            std::cerr << "Wake sender init failed\n";
            return 2;
        }
    } catch (const ConfigError& ex) {
        spdlog::critical("{}", ex.what());
        std::cerr << "lanwake-qt: " << ex.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);
    std::signal(SIGHUP, reload_handler);

    UIQt w(engine.service(), engine.scanner());
    w.show();

    // signals only set flags; the event loop picks them up here
    QTimer poll;
    QObject::connect(&poll, &QTimer::timeout, [&app, &w]() {
        if (g_terminate.load()) app.quit();
        if (g_reload.exchange(false)) w.reload();
    });
    poll.start(200);
    app.exec();

    spdlog::info("Service stopping");
    engine.stop();
    return 0;
}
