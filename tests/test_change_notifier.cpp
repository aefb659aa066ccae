#include <doctest/doctest.h>
#include "TestDoubles.hpp"
#include "server/ChangeNotifier.hpp"
#include "server/DeviceStore.hpp"

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>

using namespace lan_sentry::server;
using lan_sentry::common::Clock;
using lan_sentry::common::DeviceStatus;
using lan_sentry::testing::RecordingSubscriber;

static void seed(DeviceStore& store, const std::string& ip) {
    SweepResult r;
    r.address = ip;
    r.link_address = "Unknown";
    r.name = ip;
    r.device_class = lan_sentry::common::DeviceClass::Device;
    r.seen_at = Clock::now();
    r.response_ms = 1.0;
    store.Merge(r);
}

namespace {
    // Holds its first delivery until Release(), keeping the notifier busy meanwhile.
    class StallingSubscriber : public lan_sentry::server::Subscriber {
    public:
        bool IsWritable() const override { return true; }

        void Deliver(const FrameRef &) override {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_entered = true;
            m_cv.notify_all();
            m_cv.wait(lock, [this] { return m_released; });
        }

        bool WaitUntilEntered() {
            std::unique_lock<std::mutex> lock(m_mutex);
            return m_cv.wait_for(lock, std::chrono::seconds(5), [this] { return m_entered; });
        }

        void Release() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_released = true;
            }
            m_cv.notify_all();
        }

    private:
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_entered = false;
        bool m_released = false;
    };
}

TEST_CASE("New subscriber gets the current snapshot as its first event") {
    DeviceStore store;
    seed(store, "192.168.1.1");
    seed(store, "192.168.1.50");
    ChangeNotifier notifier(store);

    auto sub = std::make_shared<RecordingSubscriber>();
    SubscriberId id = notifier.Subscribe(sub);
    CHECK(id != 0);
    notifier.BroadcastSnapshot(lan_sentry::common::EVENT_SCAN_COMPLETE);

    auto events = sub->Events();
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == "initial");
    REQUIRE(events[0].devices.size() == 2);
    CHECK(events[0].devices[0].address == "192.168.1.1");
    CHECK(events[1].kind == "scan-complete");
}

TEST_CASE("Broadcast encodes once and shares the frame") {
    DeviceStore store;
    ChangeNotifier notifier(store);

    auto a = std::make_shared<RecordingSubscriber>();
    auto b = std::make_shared<RecordingSubscriber>();
    notifier.Subscribe(a);
    notifier.Subscribe(b);

    notifier.BroadcastStatusChange({"192.168.1.7", DeviceStatus::Offline, Clock::now()});

    auto fa = a->Frames();
    auto fb = b->Frames();
    REQUIRE(fa.size() == 2);
    REQUIRE(fb.size() == 2);
    CHECK(fa[1].get() == fb[1].get());

    auto events = a->Events();
    REQUIRE(events[1].change.has_value());
    CHECK(events[1].change->address == "192.168.1.7");
}

TEST_CASE("Closed or failing subscribers are skipped without affecting others") {
    DeviceStore store;
    ChangeNotifier notifier(store);

    auto closed = std::make_shared<RecordingSubscriber>();
    auto broken = std::make_shared<RecordingSubscriber>();
    auto healthy = std::make_shared<RecordingSubscriber>();
    notifier.Subscribe(closed);
    notifier.Subscribe(broken);
    notifier.Subscribe(healthy);

    closed->writable = false;
    broken->fail = true;

    CHECK_NOTHROW(notifier.BroadcastSnapshot(lan_sentry::common::EVENT_SCAN_COMPLETE));

    CHECK(closed->Frames().size() == 1);
    CHECK(broken->Frames().size() == 1);
    REQUIRE(healthy->Frames().size() == 2);
    CHECK(healthy->Events()[1].kind == "scan-complete");
}

TEST_CASE("Unsubscribed peers receive nothing further") {
    DeviceStore store;
    ChangeNotifier notifier(store);

    auto sub = std::make_shared<RecordingSubscriber>();
    SubscriberId id = notifier.Subscribe(sub);
    CHECK(notifier.SubscriberCount() == 1);

    notifier.Unsubscribe(id);
    CHECK(notifier.SubscriberCount() == 0);

    notifier.BroadcastSnapshot(lan_sentry::common::EVENT_SCAN_COMPLETE);
    CHECK(sub->Frames().size() == 1);

    // unknown id is harmless
    notifier.Unsubscribe(id);
    CHECK(notifier.Subscribe(nullptr) == 0);
}

TEST_CASE("A snapshot broadcast reflects the store as of delivery, not as of the call") {
    DeviceStore store;
    seed(store, "192.168.1.10");
    ChangeNotifier notifier(store);

    auto watcher = std::make_shared<RecordingSubscriber>();
    notifier.Subscribe(watcher);

    // the stalling subscriber keeps the notifier busy inside Subscribe
    auto staller = std::make_shared<StallingSubscriber>();
    auto joining = std::async(std::launch::async, [&] { return notifier.Subscribe(staller); });
    REQUIRE(staller->WaitUntilEntered());

    auto broadcasting = std::async(std::launch::async, [&] {
        notifier.BroadcastSnapshot(lan_sentry::common::EVENT_SCAN_COMPLETE);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // lands after the broadcast was requested but before it could deliver
    seed(store, "192.168.1.20");
    staller->Release();

    joining.get();
    broadcasting.get();

    auto events = watcher->Events();
    REQUIRE(events.size() == 2);
    CHECK(events[1].kind == "scan-complete");
    CHECK(events[1].devices.size() == 2);
}
