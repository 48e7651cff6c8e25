#include <gtest/gtest.h>
#include <stdexcept>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "PortProbe.hpp"

using std::chrono::milliseconds;

namespace {

// Loopback TCP socket on an ephemeral port; listening only when asked.
class LoopbackSocket {
public:
    explicit LoopbackSocket(bool listening) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        if (listening) ::listen(fd_, 4);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~LoopbackSocket() { ::close(fd_); }

    uint16_t port() const { return port_; }

private:
    int fd_;
    uint16_t port_;
};

}

TEST(PortProbe, ListeningPortIsReachable) {
    LoopbackSocket listener(true);
    ASSERT_NE(listener.port(), 0);
    EXPECT_TRUE(probe_port("127.0.0.1", listener.port(), milliseconds(1000)));
}

TEST(PortProbe, ResolvesHostNames) {
    LoopbackSocket listener(true);
    EXPECT_TRUE(probe_port("localhost", listener.port(), milliseconds(1000)));
}

TEST(PortProbe, ClosedPortIsUnreachable) {
    // bound but not listening, so connections are refused
    LoopbackSocket closed(false);
    ASSERT_NE(closed.port(), 0);
    EXPECT_FALSE(probe_port("127.0.0.1", closed.port(), milliseconds(1000)));
}

TEST(PortProbe, UnresolvableNameIsUnreachable) {
    EXPECT_FALSE(probe_port("no-such-host.invalid", 22, milliseconds(500)));
}

TEST(PortProbe, MalformedInputThrows) {
    EXPECT_THROW(probe_port("", 22, milliseconds(100)), std::invalid_argument);
    EXPECT_THROW(probe_port("bad host", 22, milliseconds(100)), std::invalid_argument);
    EXPECT_THROW(probe_port("127.0.0.1", 0, milliseconds(100)), std::invalid_argument);
    EXPECT_FALSE(is_valid_probe_address(std::string(254, 'a')));
    EXPECT_TRUE(is_valid_probe_address("pc-01.office_lan"));
}

TEST(PortProbe, PollTimeoutCountsDownToDeadline) {
    const auto now = std::chrono::steady_clock::now();
    EXPECT_EQ(poll_timeout(now + milliseconds(250), now), 250);
    EXPECT_EQ(poll_timeout(now + std::chrono::microseconds(1500), now), 2);
    EXPECT_EQ(poll_timeout(now, now), 0);
    EXPECT_EQ(poll_timeout(now - milliseconds(10), now), 0);
}
