#ifndef MAGIC_PACKET_HPP
#define MAGIC_PACKET_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include "HardwareAddress.hpp"

namespace MagicPacket {
    // well-known WOL destination ports
    constexpr uint16_t PORT_DISCARD = 9;
    constexpr uint16_t PORT_ECHO = 7;

    constexpr uint8_t SYNC_BYTE = 0xFF;
    constexpr std::size_t SYNC_LENGTH = 6;
    constexpr std::size_t REPETITIONS = 16;
    constexpr std::size_t SIZE = SYNC_LENGTH + REPETITIONS * HardwareAddress::LENGTH;

    using Packet = std::array<uint8_t, SIZE>;

    // 6 sync bytes followed by the target address 16 times
    inline Packet build(const HardwareAddress& target) {
        Packet packet;
        packet.fill(SYNC_BYTE);
        const auto& mac = target.bytes();
        for (std::size_t i = 0; i < REPETITIONS; ++i) {
            std::memcpy(packet.data() + SYNC_LENGTH + i * mac.size(), mac.data(), mac.size());
        }
        return packet;
    }

    inline bool is_wol_port(uint16_t port) {
        return port == PORT_DISCARD || port == PORT_ECHO;
    }
}

#endif // MAGIC_PACKET_HPP
