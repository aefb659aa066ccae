#include <doctest/doctest.h>
#include "TestDoubles.hpp"
#include "server/MetricsStub.hpp"
#include "server/PingService.hpp"

#include <stdexcept>

using namespace lan_sentry::server;
using lan_sentry::testing::FakeNetworkProbe;

TEST_CASE("Reachable host reports average latency and no loss") {
    FakeNetworkProbe net;
    net.SetUp("192.168.1.9", 2.5);

    PingService pinger(net, 4);
    auto report = pinger.Ping("192.168.1.9");

    CHECK(report.alive);
    CHECK(report.sent == 4);
    CHECK(report.received == 4);
    CHECK(report.packet_loss_pct == 0);
    CHECK(report.response_time_ms == doctest::Approx(2.5));
    CHECK(net.PingCalls() == 4);
}

TEST_CASE("Silent host is reported dead with full loss") {
    FakeNetworkProbe net;

    PingService pinger(net, 3);
    auto report = pinger.Ping("192.168.1.9");

    CHECK_FALSE(report.alive);
    CHECK(report.sent == 3);
    CHECK(report.received == 0);
    CHECK(report.packet_loss_pct == 100);
    CHECK(report.response_time_ms == doctest::Approx(0.0));
}

TEST_CASE("Ping validates the address before probing") {
    FakeNetworkProbe net;
    PingService pinger(net);

    CHECK_THROWS_AS(pinger.Ping("192.168.1"), std::invalid_argument);
    CHECK_THROWS_AS(pinger.Ping("example.com"), std::invalid_argument);
    CHECK(net.PingCalls() == 0);
}

TEST_CASE("Probe errors propagate out of the ping service") {
    FakeNetworkProbe net;
    net.SetPingError("192.168.1.9");

    PingService pinger(net);
    CHECK_THROWS_AS(pinger.Ping("192.168.1.9"), std::runtime_error);
}

TEST_CASE("Metrics stub stays inside its documented ranges") {
    MetricsStub metrics;
    for (int i = 0; i < 200; ++i) {
        auto m = metrics.Sample();
        CHECK(m.cpu < 100);
        CHECK(m.memory < 100);
        CHECK(m.bandwidth < 1000);
        CHECK(m.uptime < 86400);
    }
}
