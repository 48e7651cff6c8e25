#include "Config.hpp"
#include <arpa/inet.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/program_options.hpp>
#include "ConfigError.hpp"

namespace po = boost::program_options;

namespace {

const std::string SECTION = "ServerConfig.";

po::options_description file_options() {
    po::options_description desc("configuration file");
    desc.add_options()
        ("ServerConfig.COMPUTERS_LIST", po::value<std::string>())
        ("ServerConfig.TIME_WAIT", po::value<long long>())
        ("ServerConfig.CHECK_PORT", po::value<long long>())
        ("ServerConfig.NUM_SCAN_THREADS", po::value<long long>())
        ("ServerConfig.SCAN_INTERVAL", po::value<long long>())
        ("ServerConfig.PROBE_TIMEOUT_MS", po::value<long long>())
        ("ServerConfig.STALE_AFTER", po::value<long long>())
        ("ServerConfig.WOL_PORT", po::value<long long>())
        ("ServerConfig.BROADCAST_ADDRESS", po::value<std::string>())
        ("ServerConfig.BROADCAST_INTERFACE", po::value<std::string>())
        ("ServerConfig.LOG_FILE", po::value<std::string>())
        ("ServerConfig.LOG_LEVEL", po::value<std::string>());
    return desc;
}

bool has(const po::variables_map& vm, const std::string& key) {
    return vm.count(SECTION + key) > 0;
}

template <typename T>
T get(const po::variables_map& vm, const std::string& key) {
    if (!has(vm, key)) throw ConfigError(key + " must be specified");
    return vm[SECTION + key].as<T>();
}

long long get_in_range(const po::variables_map& vm, const std::string& key, long long lo, long long hi) {
    long long v = get<long long>(vm, key);
    if (v < lo || v > hi) {
        throw ConfigError(key + " must be between " + std::to_string(lo) + " and " + std::to_string(hi));
    }
    return v;
}

std::string resolve_path(const std::string& base_dir, const std::string& value) {
    std::filesystem::path p(value);
    if (p.is_absolute() || base_dir.empty()) return p.string();
    return (std::filesystem::path(base_dir) / p).string();
}

} // namespace

bool is_valid_log_level(const std::string& level) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* l : levels) {
        if (level == l) return true;
    }
    return false;
}

Config parse_config(std::istream& in, const std::string& base_dir) {
    po::variables_map vm;
    try {
        // unknown keys (PORT, SSL, CERTFILE, KEYFILE, HTML) belong to the web front-end
        po::store(po::parse_config_file(in, file_options(), true), vm);
        po::notify(vm);
    } catch (const po::error& ex) {
        throw ConfigError(ex.what());
    }

    Config cfg;
    cfg.computers_list = get<std::string>(vm, "COMPUTERS_LIST");
    if (cfg.computers_list.empty()) throw ConfigError("COMPUTERS_LIST must be specified");
    cfg.computers_list = resolve_path(base_dir, cfg.computers_list);

    cfg.time_wait = std::chrono::seconds(get_in_range(vm, "TIME_WAIT", 0, 86400 * 365));
    cfg.check_port = static_cast<uint16_t>(get_in_range(vm, "CHECK_PORT", 1, 65535));
    cfg.num_scan_threads = static_cast<std::size_t>(get_in_range(vm, "NUM_SCAN_THREADS", 1, 1024));

    if (has(vm, "SCAN_INTERVAL")) {
        cfg.scan_interval = std::chrono::seconds(get_in_range(vm, "SCAN_INTERVAL", 1, 86400));
    }
    if (has(vm, "PROBE_TIMEOUT_MS")) {
        cfg.probe_timeout = std::chrono::milliseconds(get_in_range(vm, "PROBE_TIMEOUT_MS", 1, 600000));
    }
    if (cfg.probe_timeout >= cfg.scan_interval) {
        throw ConfigError("PROBE_TIMEOUT_MS must be shorter than SCAN_INTERVAL");
    }
    if (has(vm, "STALE_AFTER")) {
        cfg.stale_after = std::chrono::seconds(get_in_range(vm, "STALE_AFTER", 1, 86400 * 365));
    }

    if (has(vm, "WOL_PORT")) {
        long long port = get<long long>(vm, "WOL_PORT");
        if (port < 0 || port > 65535 || !MagicPacket::is_wol_port(static_cast<uint16_t>(port))) {
            throw ConfigError("WOL_PORT must be " + std::to_string(MagicPacket::PORT_DISCARD) + " or " +
                              std::to_string(MagicPacket::PORT_ECHO));
        }
        cfg.wol_port = static_cast<uint16_t>(port);
    }
    if (has(vm, "BROADCAST_ADDRESS")) {
        cfg.broadcast_address = get<std::string>(vm, "BROADCAST_ADDRESS");
        struct in_addr probe;
        if (inet_pton(AF_INET, cfg.broadcast_address.c_str(), &probe) != 1) {
            throw ConfigError("BROADCAST_ADDRESS '" + cfg.broadcast_address + "' is not an IPv4 address");
        }
    }
    if (has(vm, "BROADCAST_INTERFACE")) cfg.broadcast_interface = get<std::string>(vm, "BROADCAST_INTERFACE");

    if (has(vm, "LOG_FILE")) {
        std::string log_file = get<std::string>(vm, "LOG_FILE");
        if (!log_file.empty()) cfg.log_file = resolve_path(base_dir, log_file);
    }
    if (has(vm, "LOG_LEVEL")) {
        cfg.log_level = get<std::string>(vm, "LOG_LEVEL");
        if (!is_valid_log_level(cfg.log_level)) throw ConfigError("unknown LOG_LEVEL '" + cfg.log_level + "'");
    }
    return cfg;
}

Config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("cannot open configuration file " + path);
    std::string base_dir = std::filesystem::path(path).parent_path().string();
    return parse_config(in, base_dir);
}

Options parse_options(int argc, char** argv, bool with_headless) {
    Options opts;
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(&opts.config_path)->default_value(opts.config_path),
         "configuration file")
        ("log-level", po::value<std::string>(&opts.log_level), "override LOG_LEVEL");
    if (with_headless) {
        desc.add_options()("headless", po::bool_switch(&opts.headless), "no screen, log to the console");
    }

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
        opts.help = vm.count("help") > 0;
    } catch (const po::error& ex) {
        throw ConfigError(ex.what());
    }
    if (!opts.log_level.empty() && !is_valid_log_level(opts.log_level)) {
        throw ConfigError("unknown log level '" + opts.log_level + "'");
    }

    std::ostringstream usage;
    usage << desc;
    opts.usage = usage.str();
    return opts;
}
