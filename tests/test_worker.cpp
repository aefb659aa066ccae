#include <doctest/doctest.h>
#include "TestDoubles.hpp"
#include "server/Worker.hpp"

using namespace lan_sentry::server;
using lan_sentry::protocol::ErrorCode;
using lan_sentry::protocol::MessageType;
using lan_sentry::testing::FakeNetworkProbe;
using lan_sentry::testing::RecordingSink;

namespace {
    struct WorkerRig {
        FakeNetworkProbe net;
        TopologyResolver resolver{net};
        HostProbe probe{net, ProbeSettings{}};
        DeviceStore store;
        ChangeNotifier notifier{store};
        SweepCoordinator sweeper{resolver, probe, store, notifier};
        PingService pinger{net, 1};
        MetricsStub metrics;
        ApiHandler handler{resolver, sweeper, store, pinger, metrics};
        RecordingSink sink;

        WorkerRig() { net.AddInterface("eth0", "192.168.1.23", "255.255.255.0"); }
    };

    ErrorCode error_code(const RecordingSink::Entry &entry) {
        REQUIRE(entry.type == MessageType::ErrorResp);
        lan_sentry::common::ErrorInfo error;
        REQUIRE(lan_sentry::common::DecodeError(entry.payload, error));
        return error.code;
    }
}

TEST_CASE("With a single worker thread a second scan is refused on arrival") {
    WorkerRig rig;
    rig.net.SetUp("192.168.1.40");
    rig.net.CloseGate();

    Worker worker(rig.handler, 1);
    worker.SetResponseSink(&rig.sink);
    worker.Start();

    worker.AddJob(1, MessageType::ScanReq, {});
    REQUIRE(rig.net.WaitForBlockedPing());

    worker.AddJob(2, MessageType::ScanReq, {});

    // answered inside AddJob, while the first sweep is still blocked
    auto entries = rig.sink.Entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].conn_id == 2);
    CHECK(error_code(entries[0]) == ErrorCode::ScanInProgress);

    rig.net.OpenGate();
    REQUIRE(rig.sink.WaitForCount(2));
    worker.Stop();

    entries = rig.sink.Entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[1].conn_id == 1);
    CHECK(entries[1].type == MessageType::ScanResp);

    // one sweep over the /24, not two
    CHECK(rig.net.PingCalls() == 254);
    CHECK_FALSE(rig.sweeper.IsSweeping());
    CHECK(rig.store.Size() == 1);
}

TEST_CASE("A scan waiting behind a slow request already holds the sweep slot") {
    WorkerRig rig;
    rig.net.CloseGate();

    Worker worker(rig.handler, 1);
    worker.SetResponseSink(&rig.sink);
    worker.Start();

    worker.AddJob(1, MessageType::PingReq, lan_sentry::common::EncodeAddress("192.168.1.9"));
    REQUIRE(rig.net.WaitForBlockedPing());

    worker.AddJob(2, MessageType::ScanReq, {});
    CHECK(rig.sweeper.IsSweeping());
    CHECK(rig.sink.Entries().empty());

    worker.AddJob(3, MessageType::ScanReq, {});
    auto entries = rig.sink.Entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].conn_id == 3);
    CHECK(error_code(entries[0]) == ErrorCode::ScanInProgress);

    rig.net.OpenGate();
    REQUIRE(rig.sink.WaitForCount(3));
    worker.Stop();

    entries = rig.sink.Entries();
    CHECK(entries[1].conn_id == 1);
    CHECK(entries[1].type == MessageType::PingResp);
    CHECK(entries[2].conn_id == 2);
    CHECK(entries[2].type == MessageType::ScanResp);
    CHECK_FALSE(rig.sweeper.IsSweeping());
}

TEST_CASE("Dropping a queued scan releases its reservation") {
    WorkerRig rig;

    {
        Worker worker(rig.handler, 1);
        worker.SetResponseSink(&rig.sink);
        worker.AddJob(1, MessageType::ScanReq, {});
        CHECK(rig.sweeper.IsSweeping());
    }

    CHECK_FALSE(rig.sweeper.IsSweeping());
    CHECK(rig.net.PingCalls() == 0);
    CHECK_NOTHROW(rig.sweeper.Sweep());
}

TEST_CASE("Other requests are answered in order through the sink") {
    WorkerRig rig;

    Worker worker(rig.handler, 2);
    worker.SetResponseSink(&rig.sink);
    worker.Start();

    worker.AddJob(7, MessageType::DeviceListReq, {});
    REQUIRE(rig.sink.WaitForCount(1));
    worker.AddJob(8, MessageType::DeviceDetailReq, lan_sentry::common::EncodeAddress("192.168.1.99"));
    REQUIRE(rig.sink.WaitForCount(2));
    worker.Stop();

    auto entries = rig.sink.Entries();
    CHECK(entries[0].conn_id == 7);
    CHECK(entries[0].type == MessageType::DeviceListResp);
    CHECK(entries[1].conn_id == 8);
    CHECK(error_code(entries[1]) == ErrorCode::NotFound);
}
