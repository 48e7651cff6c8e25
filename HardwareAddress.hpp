#ifndef HARDWARE_ADDRESS_HPP
#define HARDWARE_ADDRESS_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

// 6-byte link-layer (MAC) address of a managed host.
class HardwareAddress {
public:
    static constexpr std::size_t LENGTH = 6;
    using Bytes = std::array<uint8_t, LENGTH>;

    HardwareAddress();
    explicit HardwareAddress(const Bytes& bytes);

    // Accepts "AA:BB:CC:DD:EE:FF", "AA-BB-CC-DD-EE-FF" and "AABBCCDDEEFF"
    // (any case). Returns nullopt for anything else.
    static std::optional<HardwareAddress> parse(const std::string& text);

    const Bytes& bytes() const { return bytes_; }

    // Upper-case, colon separated.
    std::string to_string() const;

    bool operator==(const HardwareAddress& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const HardwareAddress& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

#endif // HARDWARE_ADDRESS_HPP
