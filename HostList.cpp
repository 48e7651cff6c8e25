#include "HostList.hpp"
#include <fstream>
#include <sstream>
#include <unordered_set>
#include "ConfigError.hpp"

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, delim)) fields.push_back(trim(field));
    // getline drops an empty trailing field
    if (!line.empty() && line.back() == delim) fields.emplace_back();
    return fields;
}

} // namespace

namespace HostList {

std::vector<HostEntry> parse(std::istream& in, const std::string& source) {
    std::vector<HostEntry> entries;
    std::unordered_set<std::string> seen;
    std::string line;
    unsigned int line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') continue;

        auto where = [&]() { return source + ":" + std::to_string(line_number) + ": "; };

        auto fields = split(content, DELIMITER);
        if (fields.size() != 3) {
            throw ConfigError(where() + "expected 3 fields separated by '" + DELIMITER + "', got " +
                              std::to_string(fields.size()));
        }
        if (fields[0].empty()) throw ConfigError(where() + "empty host id");

        auto mac = HardwareAddress::parse(fields[2]);
        if (!mac) throw ConfigError(where() + "invalid hardware address '" + fields[2] + "'");

        if (!seen.insert(fields[0]).second) {
            throw ConfigError(where() + "duplicate host id '" + fields[0] + "'");
        }
        entries.push_back({fields[0], fields[1], *mac});
    }
    return entries;
}

std::vector<HostEntry> load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("cannot open host list " + path);
    return parse(in, path);
}

}
