#include "Logging.hpp"
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "ConfigError.hpp"

void init_logging(const std::string& log_file, const std::string& level, bool console) {
    std::vector<spdlog::sink_ptr> sinks;
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
        } catch (const spdlog::spdlog_ex& ex) {
            throw ConfigError(std::string("cannot open log file: ") + ex.what());
        }
    }
    if (console) sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (sinks.empty()) sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>("lanwake", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
}
