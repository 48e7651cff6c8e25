#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

// Installs the default "lanwake" logger. log_file may be empty; console
// selects an additional stderr sink (never while ncurses owns the screen).
// Throws ConfigError when the log file cannot be opened.
void init_logging(const std::string& log_file, const std::string& level, bool console);

#endif // LOGGING_HPP
