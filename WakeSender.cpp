#include "WakeSender.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <spdlog/spdlog.h>

std::string name_for(WakeResult result) {
    switch (result) {
        case WakeResult::Sent: return "sent";
        case WakeResult::InvalidAddress: return "invalid hardware address";
        case WakeResult::SendFailed: return "send failed";
    }
    return "unknown";
}

WakeSender::WakeSender(uint16_t port, const std::string& broadcast_addr)
    : port_(port), broadcast_addr_(broadcast_addr), sockfd_(-1), dest_{} {}

WakeSender::~WakeSender() {
    close();
}

bool WakeSender::init(const std::string& if_name) {
    if (!if_name.empty() && !find_interface_broadcast(if_name, broadcast_addr_)) {
        spdlog::error("cannot determine the broadcast address of interface {}", if_name);
        return false;
    }

    close();
    sockfd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sockfd_ < 0) {
        spdlog::error("wake socket: {}", std::strerror(errno));
        return false;
    }

    int on = 1;
    if (setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        spdlog::error("setsockopt SO_BROADCAST: {}", std::strerror(errno));
        close();
        return false;
    }

    std::memset(&dest_, 0, sizeof(dest_));
    dest_.sin_family = AF_INET;
    dest_.sin_port = htons(port_);
    if (inet_pton(AF_INET, broadcast_addr_.c_str(), &dest_.sin_addr) != 1) {
        spdlog::error("invalid broadcast address {}", broadcast_addr_);
        close();
        return false;
    }

    spdlog::debug("magic packets go to {}:{}", broadcast_addr_, port_);
    return true;
}

void WakeSender::close() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
}

WakeResult WakeSender::wake(const std::vector<uint8_t>& address) {
    if (address.size() != HardwareAddress::LENGTH) return WakeResult::InvalidAddress;
    HardwareAddress::Bytes bytes;
    std::memcpy(bytes.data(), address.data(), bytes.size());
    return wake(HardwareAddress(bytes));
}

WakeResult WakeSender::wake(const HardwareAddress& address) {
    if (sockfd_ < 0) return WakeResult::SendFailed;

    const MagicPacket::Packet packet = MagicPacket::build(address);
    ssize_t r = sendto(sockfd_, packet.data(), packet.size(), 0,
                       reinterpret_cast<struct sockaddr*>(&dest_), sizeof(dest_));
    if (r != static_cast<ssize_t>(packet.size())) {
        spdlog::error("failed to send magic packet to {}: {}", address.to_string(),
                      r < 0 ? std::strerror(errno) : "short write");
        return WakeResult::SendFailed;
    }
    return WakeResult::Sent;
}

std::string WakeSender::broadcast_address() const { return broadcast_addr_; }
uint16_t WakeSender::port() const { return port_; }

bool WakeSender::find_interface_broadcast(const std::string& if_name, std::string& out_bcast) {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        spdlog::error("getifaddrs: {}", std::strerror(errno));
        return false;
    }

    bool found = false;
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (if_name != ifa->ifa_name) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        struct sockaddr_in* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        struct sockaddr_in* netmask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
        if (!addr || !netmask) continue;

        uint32_t ip = ntohl(addr->sin_addr.s_addr);
        uint32_t mask = ntohl(netmask->sin_addr.s_addr);
        uint32_t bcast = (ip & mask) | (~mask);

        struct in_addr baddr;
        baddr.s_addr = htonl(bcast);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &baddr, buf, sizeof(buf)) == nullptr) continue;

        out_bcast = buf;
        found = true;
        break;
    }

    freeifaddrs(ifaddr);
    return found;
}
