#include "HardwareAddress.hpp"
#include <cstdio>

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

HardwareAddress::HardwareAddress() : bytes_{} {}

HardwareAddress::HardwareAddress(const Bytes& bytes) : bytes_(bytes) {}

std::optional<HardwareAddress> HardwareAddress::parse(const std::string& text) {
    // 12 bare digits, or 6 pairs joined by ':' or '-'
    const bool bare = text.size() == LENGTH * 2;
    if (!bare && text.size() != LENGTH * 3 - 1) return std::nullopt;

    const std::size_t stride = bare ? 2 : 3;
    Bytes bytes{};
    for (std::size_t i = 0; i < LENGTH; ++i) {
        std::size_t pos = i * stride;
        int hi = hex_value(text[pos]);
        int lo = hex_value(text[pos + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        if (!bare && i + 1 < LENGTH) {
            char sep = text[pos + 2];
            if (sep != ':' && sep != '-') return std::nullopt;
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return HardwareAddress(bytes);
}

std::string HardwareAddress::to_string() const {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
    return buf;
}
