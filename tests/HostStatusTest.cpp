#include <gtest/gtest.h>
#include "HostStatus.hpp"

using std::chrono::seconds;

namespace {

const HostClock::time_point T0 = HostClock::time_point() + std::chrono::hours(1);

}

TEST(HostStatus, StartsPendingWithoutPrevious) {
    HostStatus status(T0);
    EXPECT_TRUE(status.is_pending());
    EXPECT_EQ(status.current(), HostState::Pending);
    EXPECT_FALSE(status.last_change().has_value());
    EXPECT_FALSE(status.last_probe().has_value());
}

TEST(HostStatus, CommitsOnlyAfterTimeWait) {
    HostStatus status(T0);
    EXPECT_FALSE(status.apply(false, T0, seconds(60)));
    EXPECT_EQ(status.current(), HostState::Pending);
    EXPECT_FALSE(status.apply(false, T0 + seconds(30), seconds(60)));
    EXPECT_TRUE(status.apply(false, T0 + seconds(60), seconds(60)));
    EXPECT_EQ(status.current(), HostState::Offline);
    EXPECT_FALSE(status.is_pending());
    ASSERT_TRUE(status.last_change().has_value());
    EXPECT_EQ(*status.last_change(), T0 + seconds(60));

    // host comes up: previous state stays visible until the wait is over
    EXPECT_FALSE(status.apply(true, T0 + seconds(100), seconds(60)));
    EXPECT_TRUE(status.is_pending());
    EXPECT_EQ(status.current(), HostState::Offline);
    EXPECT_FALSE(status.apply(true, T0 + seconds(130), seconds(60)));
    EXPECT_TRUE(status.apply(true, T0 + seconds(160), seconds(60)));
    EXPECT_EQ(status.current(), HostState::Online);
}

TEST(HostStatus, FlapBeforeTimeWaitIsSuppressed) {
    HostStatus status(T0);
    ASSERT_TRUE(status.apply(false, T0, seconds(0)));
    ASSERT_EQ(status.current(), HostState::Offline);
    auto committed_at = status.last_change();

    EXPECT_FALSE(status.apply(true, T0 + seconds(10), seconds(60)));
    EXPECT_FALSE(status.apply(false, T0 + seconds(20), seconds(60)));
    EXPECT_FALSE(status.is_pending());
    EXPECT_EQ(status.current(), HostState::Offline);
    EXPECT_EQ(status.last_change(), committed_at);

    // the interrupted transition starts over
    EXPECT_FALSE(status.apply(true, T0 + seconds(30), seconds(60)));
    EXPECT_FALSE(status.apply(true, T0 + seconds(80), seconds(60)));
    EXPECT_TRUE(status.apply(true, T0 + seconds(90), seconds(60)));
}

TEST(HostStatus, DisagreementBeforeFirstCommitRetargets) {
    HostStatus status(T0);
    EXPECT_FALSE(status.apply(true, T0 + seconds(5), seconds(60)));
    ASSERT_TRUE(status.is_pending());
    const auto& pending = std::get<HostStatus::Pending>(status.phase());
    EXPECT_EQ(pending.target, HostState::Online);
    EXPECT_FALSE(pending.previous.has_value());
    EXPECT_EQ(pending.since, T0 + seconds(5));
    EXPECT_EQ(status.current(), HostState::Pending);
    EXPECT_TRUE(status.apply(true, T0 + seconds(65), seconds(60)));
    EXPECT_EQ(status.current(), HostState::Online);
}

TEST(HostStatus, ZeroWaitCommitsOnNextAgreeingProbe) {
    HostStatus status(T0);
    // the first probe disagrees with the initial Offline target
    EXPECT_FALSE(status.apply(true, T0, seconds(0)));
    ASSERT_TRUE(status.apply(true, T0 + seconds(1), seconds(0)));
    EXPECT_FALSE(status.apply(false, T0 + seconds(2), seconds(0)));
    EXPECT_EQ(status.current(), HostState::Online);
    EXPECT_TRUE(status.apply(false, T0 + seconds(3), seconds(0)));
    EXPECT_EQ(status.current(), HostState::Offline);
}

TEST(HostStatus, RecordsLastProbe) {
    HostStatus status(T0);
    status.apply(true, T0 + seconds(3), seconds(60));
    ASSERT_TRUE(status.last_probe().has_value());
    EXPECT_EQ(status.last_probe()->at, T0 + seconds(3));
    EXPECT_TRUE(status.last_probe()->reachable);
}

TEST(HostState, Names) {
    EXPECT_EQ(name_for(HostState::Online), "online");
    EXPECT_EQ(name_for(HostState::Offline), "offline");
    EXPECT_EQ(name_for(HostState::Pending), "pending");
}
