#ifndef WAKE_SENDER_HPP
#define WAKE_SENDER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <netinet/in.h>
#include "HardwareAddress.hpp"
#include "MagicPacket.hpp"

enum class WakeResult {
    Sent,
    InvalidAddress,
    SendFailed
};

std::string name_for(WakeResult result);

// Broadcasts WOL magic packets. Sent only means the datagram was handed to
// the network stack; WOL has no acknowledgement.
class WakeSender {
public:
    explicit WakeSender(uint16_t port = MagicPacket::PORT_DISCARD,
                        const std::string& broadcast_addr = "255.255.255.255");
    ~WakeSender();

    // Opens the broadcast socket. With an interface name the directed
    // broadcast address of that interface replaces the configured one.
    bool init(const std::string& if_name = "");
    void close();

    // Raw bytes must be exactly 6 long; checked before any socket call.
    WakeResult wake(const std::vector<uint8_t>& address);
    WakeResult wake(const HardwareAddress& address);

    std::string broadcast_address() const;
    uint16_t port() const;

private:
    uint16_t port_;
    std::string broadcast_addr_;
    int sockfd_;
    struct sockaddr_in dest_;

    bool find_interface_broadcast(const std::string& if_name, std::string& out_bcast);
};

#endif // WAKE_SENDER_HPP
