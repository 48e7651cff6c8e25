#include <gtest/gtest.h>
#include "HardwareAddress.hpp"
#include "MagicPacket.hpp"

TEST(HardwareAddress, ParsesColonSeparated) {
    auto mac = HardwareAddress::parse("00:1a:2B:3c:4D:5e");
    ASSERT_TRUE(mac.has_value());
    HardwareAddress::Bytes expected{0x00, 0x1A, 0x2B, 0x3C, 0x4D, 0x5E};
    EXPECT_EQ(mac->bytes(), expected);
    EXPECT_EQ(mac->to_string(), "00:1A:2B:3C:4D:5E");
}

TEST(HardwareAddress, ParsesDashSeparatedAndBare) {
    auto dashed = HardwareAddress::parse("00-1A-2B-3C-4D-5E");
    auto bare = HardwareAddress::parse("001a2b3c4d5e");
    ASSERT_TRUE(dashed.has_value());
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(*dashed, *bare);
}

TEST(HardwareAddress, RejectsMalformed) {
    EXPECT_FALSE(HardwareAddress::parse("").has_value());
    EXPECT_FALSE(HardwareAddress::parse("00:1A:2B:3C:4D").has_value());
    EXPECT_FALSE(HardwareAddress::parse("00:1A:2B:3C:4D:5G").has_value());
    EXPECT_FALSE(HardwareAddress::parse("00.1A.2B.3C.4D.5E").has_value());
    EXPECT_FALSE(HardwareAddress::parse("001A2B3C4D5E6F").has_value());
}

TEST(MagicPacket, SyncBytesThenSixteenCopies) {
    HardwareAddress mac(HardwareAddress::Bytes{0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01});
    MagicPacket::Packet packet = MagicPacket::build(mac);
    ASSERT_EQ(packet.size(), 102u);
    for (std::size_t i = 0; i < 6; ++i) EXPECT_EQ(packet[i], 0xFF);
    for (std::size_t rep = 0; rep < 16; ++rep) {
        for (std::size_t i = 0; i < 6; ++i) {
            EXPECT_EQ(packet[6 + rep * 6 + i], mac.bytes()[i]) << "repetition " << rep;
        }
    }
}

TEST(MagicPacket, WolPorts) {
    EXPECT_TRUE(MagicPacket::is_wol_port(9));
    EXPECT_TRUE(MagicPacket::is_wol_port(7));
    EXPECT_FALSE(MagicPacket::is_wol_port(80));
}
