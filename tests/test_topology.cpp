#include <doctest/doctest.h>
#include "TestDoubles.hpp"
#include "server/Errors.hpp"
#include "server/TopologyResolver.hpp"

using namespace lan_sentry::server;
using lan_sentry::testing::FakeNetworkProbe;

TEST_CASE("Resolver skips loopback, down and unaddressed interfaces") {
    FakeNetworkProbe probe;
    probe.AddInterface("lo", "127.0.0.1", "255.0.0.0", true);
    probe.AddInterface("eth1", "10.1.1.5", "255.255.255.0", false, false);
    probe.AddInterface("docker0", "0.0.0.0", "0.0.0.0");
    probe.AddInterface("wlan0", "192.168.1.23", "255.255.255.0");
    probe.AddInterface("eth2", "172.16.0.9", "255.255.255.0");

    TopologyResolver resolver(probe);
    NetworkTopology topology = resolver.Resolve();

    CHECK(topology.interface_name == "wlan0");
    CHECK(topology.address == "192.168.1.23");
    CHECK(topology.netmask == "255.255.255.0");
}

TEST_CASE("Resolver reports no network when only loopback is present") {
    FakeNetworkProbe probe;
    probe.AddInterface("lo", "127.0.0.1", "255.0.0.0", true);

    TopologyResolver resolver(probe);
    CHECK_THROWS_AS(resolver.Resolve(), NoNetworkError);
}

TEST_CASE("A /24 mask yields .1 through .254 of the host's network") {
    SweepRange range = TopologyResolver::DeriveSweepRange({"eth0", "192.168.1.77", "255.255.255.0"});

    CHECK(range.cidr == "192.168.1.0/24");

    auto addresses = range.Addresses();
    REQUIRE(addresses.size() == 254);
    CHECK(addresses.front() == "192.168.1.1");
    CHECK(addresses.back() == "192.168.1.254");

    CHECK(range.Contains("192.168.1.100"));
    CHECK_FALSE(range.Contains("192.168.1.0"));
    CHECK_FALSE(range.Contains("192.168.1.255"));
    CHECK_FALSE(range.Contains("192.168.2.100"));
    CHECK_FALSE(range.Contains("not-an-ip"));
}

TEST_CASE("Any mask other than /24 is an unsupported range") {
    CHECK_THROWS_AS(TopologyResolver::DeriveSweepRange({"eth0", "10.0.0.5", "255.255.0.0"}), UnsupportedRangeError);
    CHECK_THROWS_AS(TopologyResolver::DeriveSweepRange({"eth0", "10.0.0.5", "255.255.255.128"}), UnsupportedRangeError);
    CHECK_THROWS_AS(TopologyResolver::DeriveSweepRange({"eth0", "10.0.0.5", "garbage"}), UnsupportedRangeError);
}
