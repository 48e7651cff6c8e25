#include <gtest/gtest.h>
#include <fstream>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include "WakeService.hpp"

using std::chrono::seconds;

namespace {

const HostClock::time_point T0 = HostClock::time_point() + std::chrono::hours(1);

std::string write_hosts(const std::string& name, const std::string& text) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << text;
    return path;
}

class WakeServiceTest : public ::testing::Test {
protected:
    WakeServiceTest() : registry_(seconds(0)) {
        registry_.replace({{"pc1", "Office", *HardwareAddress::parse("00:11:22:33:44:55")},
                           {"pc2", "Lab", *HardwareAddress::parse("00:11:22:33:44:66")}},
                          T0);
    }

    HostRegistry registry_;
};

}

TEST_F(WakeServiceTest, UnknownHost) {
    WakeSender sender;
    WakeService service(registry_, sender, "unused.csv", []() { return T0; });
    EXPECT_EQ(service.request_wake("ghost"), WakeRequestResult::UnknownHost);
    EXPECT_FALSE(succeeded(WakeRequestResult::UnknownHost));
}

TEST_F(WakeServiceTest, OnlineHostIsNotWoken) {
    registry_.apply_probe("pc1", true, T0);
    registry_.apply_probe("pc1", true, T0 + seconds(1));
    ASSERT_EQ(registry_.find("pc1")->status.current(), HostState::Online);

    // uninitialized: any send attempt would fail
    WakeSender sender;
    WakeService service(registry_, sender, "unused.csv", []() { return T0; });
    WakeRequestResult result = service.request_wake("pc1");
    EXPECT_EQ(result, WakeRequestResult::AlreadyOnline);
    EXPECT_TRUE(succeeded(result));
}

TEST_F(WakeServiceTest, SendsToOfflineHost) {
    int rx = ::socket(AF_INET, SOCK_DGRAM, 0);
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(rx, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ::getsockname(rx, reinterpret_cast<struct sockaddr*>(&addr), &len);
    struct timeval tv{};
    tv.tv_sec = 2;
    ::setsockopt(rx, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    WakeSender sender(ntohs(addr.sin_port), "127.0.0.1");
    ASSERT_TRUE(sender.init());
    WakeService service(registry_, sender, "unused.csv", []() { return T0; });
    EXPECT_EQ(service.request_wake("pc2"), WakeRequestResult::Sent);

    uint8_t buf[256];
    ssize_t n = ::recv(rx, buf, sizeof(buf), 0);
    ::close(rx);
    ASSERT_EQ(n, 102);
    EXPECT_EQ(buf[6 + 5], 0x66);
}

TEST_F(WakeServiceTest, SendFailureIsReported) {
    WakeSender sender;
    WakeService service(registry_, sender, "unused.csv", []() { return T0; });
    EXPECT_EQ(service.request_wake("pc2"), WakeRequestResult::SendFailed);
}

TEST_F(WakeServiceTest, StatusesComeFromRegistry) {
    WakeSender sender;
    WakeService service(registry_, sender, "unused.csv", []() { return T0; });
    auto views = service.all_statuses();
    ASSERT_EQ(views.size(), 2u);
    EXPECT_EQ(views[0].id, "pc1");
    EXPECT_EQ(views[1].display_name, "Lab");
    EXPECT_TRUE(views[0].stale);
}

TEST_F(WakeServiceTest, ReloadReplacesHosts) {
    std::string path = write_hosts("lanwake_reload_ok.csv", "nas;Storage;aa:bb:cc:dd:ee:ff\n");
    WakeSender sender;
    WakeService service(registry_, sender, path, []() { return T0; });
    EXPECT_TRUE(service.reload());
    EXPECT_EQ(registry_.ids(), (std::vector<std::string>{"nas"}));
}

TEST_F(WakeServiceTest, FailedReloadKeepsHosts) {
    std::string path = write_hosts("lanwake_reload_bad.csv", "nas;Storage;not-a-mac\n");
    WakeSender sender;
    WakeService service(registry_, sender, path, []() { return T0; });
    EXPECT_FALSE(service.reload());
    EXPECT_EQ(registry_.ids(), (std::vector<std::string>{"pc1", "pc2"}));
}
