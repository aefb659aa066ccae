#include <doctest/doctest.h>
#include "server/DeviceStore.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lan_sentry::server;
using lan_sentry::common::Clock;
using lan_sentry::common::DeviceClass;
using lan_sentry::common::DeviceStatus;

static SweepResult make_result(const std::string& ip, const std::string& name, Clock::time_point at) {
    SweepResult r;
    r.address = ip;
    r.link_address = "aa:aa:aa:aa:aa:aa";
    r.name = name;
    r.device_class = DeviceClass::Computer;
    r.seen_at = at;
    r.response_ms = 1.0;
    return r;
}

TEST_CASE("First merge creates exactly one online record") {
    DeviceStore store;
    auto now = Clock::now();

    CHECK(store.Merge(make_result("192.168.1.60", "laptop", now)) == true);
    CHECK(store.Size() == 1);

    auto rec = store.Get("192.168.1.60");
    REQUIRE(rec.has_value());
    CHECK(rec->status == DeviceStatus::Online);
    CHECK(rec->name == "laptop");
    CHECK(rec->last_seen == now);
}

TEST_CASE("Re-merge overwrites identity fields and leaves other records alone") {
    DeviceStore store;
    auto t0 = Clock::now();
    store.Merge(make_result("192.168.1.60", "laptop", t0));
    store.Merge(make_result("192.168.1.61", "desktop", t0));

    REQUIRE(store.ApplyLiveness("192.168.1.60", std::nullopt, t0).has_value());

    auto t1 = t0 + std::chrono::seconds(5);
    SweepResult again = make_result("192.168.1.60", "laptop-renamed", t1);
    again.link_address = "bb:bb:bb:bb:bb:bb";
    again.device_class = DeviceClass::Phone;
    again.response_ms = 9.0;

    CHECK(store.Merge(again) == false);
    CHECK(store.Size() == 2);

    auto rec = store.Get("192.168.1.60");
    REQUIRE(rec.has_value());
    CHECK(rec->status == DeviceStatus::Online);
    CHECK(rec->name == "laptop-renamed");
    CHECK(rec->link_address == "bb:bb:bb:bb:bb:bb");
    CHECK(rec->device_class == DeviceClass::Phone);
    CHECK(rec->last_seen == t1);
    CHECK(rec->last_response_ms == doctest::Approx(9.0));

    auto other = store.Get("192.168.1.61");
    REQUIRE(other.has_value());
    CHECK(other->name == "desktop");
    CHECK(other->last_seen == t0);
}

TEST_CASE("Snapshot is ordered numerically by address") {
    DeviceStore store;
    auto now = Clock::now();
    store.Merge(make_result("192.168.1.100", "c", now));
    store.Merge(make_result("192.168.1.9", "b", now));
    store.Merge(make_result("192.168.1.10", "a", now));

    auto snap = store.Snapshot();
    REQUIRE(snap.size() == 3);
    CHECK(snap[0].address == "192.168.1.9");
    CHECK(snap[1].address == "192.168.1.10");
    CHECK(snap[2].address == "192.168.1.100");
}

TEST_CASE("Lookups of unknown or malformed addresses return nothing") {
    DeviceStore store;
    CHECK_FALSE(store.Get("192.168.1.2").has_value());
    CHECK_FALSE(store.Get("bogus").has_value());
    CHECK_THROWS_AS(store.Merge(make_result("bogus", "x", Clock::now())), std::invalid_argument);
    CHECK(store.Size() == 0);
}

TEST_CASE("Failed liveness keeps last_seen, success advances it") {
    DeviceStore store;
    auto t0 = Clock::now();
    store.Merge(make_result("192.168.1.60", "laptop", t0));

    auto t1 = t0 + std::chrono::seconds(30);
    auto down = store.ApplyLiveness("192.168.1.60", std::nullopt, t1);
    REQUIRE(down.has_value());
    CHECK(down->status == DeviceStatus::Offline);
    CHECK(down->last_seen == t0);
    CHECK(store.Get("192.168.1.60")->last_seen == t0);

    // still down: no transition
    CHECK_FALSE(store.ApplyLiveness("192.168.1.60", std::nullopt, t1 + std::chrono::seconds(30)).has_value());

    auto t2 = t1 + std::chrono::seconds(60);
    auto up = store.ApplyLiveness("192.168.1.60", 4.0, t2);
    REQUIRE(up.has_value());
    CHECK(up->status == DeviceStatus::Online);
    CHECK(up->last_seen == t2);
    CHECK(store.Get("192.168.1.60")->last_response_ms == doctest::Approx(4.0));

    // still up: last_seen moves, no transition
    auto t3 = t2 + std::chrono::seconds(30);
    CHECK_FALSE(store.ApplyLiveness("192.168.1.60", 1.0, t3).has_value());
    CHECK(store.Get("192.168.1.60")->last_seen == t3);
}

TEST_CASE("Liveness for an unknown address does not create a record") {
    DeviceStore store;
    CHECK_FALSE(store.ApplyLiveness("192.168.1.60", 1.0, Clock::now()).has_value());
    CHECK(store.Size() == 0);
}

TEST_CASE("Concurrent merges keep one record per address") {
    DeviceStore store;
    std::vector<std::thread> writers;

    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&store, t] {
            for (int host = 1; host <= 50; ++host) {
                store.Merge(make_result("10.0.0." + std::to_string(host), "w" + std::to_string(t), Clock::now()));
                store.ApplyLiveness("10.0.0." + std::to_string(host), std::nullopt, Clock::now());
            }
        });
    }
    for (auto& w : writers)
        w.join();

    CHECK(store.Size() == 50);
    CHECK(store.Addresses().size() == 50);
}
