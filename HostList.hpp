#ifndef HOST_LIST_HPP
#define HOST_LIST_HPP

#include <istream>
#include <string>
#include <vector>
#include "HostRegistry.hpp"

namespace HostList {
    constexpr char DELIMITER = ';';

    // Rows are "id;display name;hardware address". Blank lines and lines
    // starting with '#' are skipped. Throws ConfigError naming source and
    // line for a wrong field count, an empty id, a bad address or a
    // duplicate id.
    std::vector<HostEntry> parse(std::istream& in, const std::string& source);

    std::vector<HostEntry> load(const std::string& path);
}

#endif // HOST_LIST_HPP
