#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <istream>
#include <string>
#include "MagicPacket.hpp"

// Settings from the [ServerConfig] section of the INI file. Relative paths
// are resolved against the directory holding the file.
struct Config {
    std::string computers_list;
    std::chrono::seconds time_wait{0};
    uint16_t check_port = 0;
    std::size_t num_scan_threads = 0;

    std::chrono::seconds scan_interval{10};
    std::chrono::milliseconds probe_timeout{1000};
    std::chrono::seconds stale_after{900};

    uint16_t wol_port = MagicPacket::PORT_DISCARD;
    std::string broadcast_address = "255.255.255.255";
    std::string broadcast_interface;

    std::string log_file;
    std::string log_level = "info";
};

// Command line of the executables.
struct Options {
    std::string config_path = "CONFIG/config.ini";
    std::string log_level;
    bool headless = false;
    bool help = false;
    std::string usage;
};

// All of these throw ConfigError.
Config load_config(const std::string& path);
Config parse_config(std::istream& in, const std::string& base_dir);
Options parse_options(int argc, char** argv, bool with_headless);

bool is_valid_log_level(const std::string& level);

#endif // CONFIG_HPP
