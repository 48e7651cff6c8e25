#ifndef CONFIG_ERROR_HPP
#define CONFIG_ERROR_HPP

#include <stdexcept>
#include <string>

// Raised while loading the configuration or the host list. Always fatal at
// startup; a reload that hits it keeps the previous host set.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

#endif // CONFIG_ERROR_HPP
