#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "DeviceStore.hpp"

namespace lan_sentry::server
{
    // One encoded DeviceEvent frame, shared by every subscriber it is delivered to.
    using FrameRef = std::shared_ptr<const std::vector<uint8_t>>;

    using SubscriberId = uint64_t;

    class Subscriber
    {
    public:
        virtual ~Subscriber() = default;

        virtual bool IsWritable() const = 0;

        // Must not block.
        virtual void Deliver(const FrameRef &frame) = 0;
    };

    class ChangeNotifier
    {
    public:
        explicit ChangeNotifier(const DeviceStore &store);

        ChangeNotifier(const ChangeNotifier &) = delete;
        ChangeNotifier &operator=(const ChangeNotifier &) = delete;

        // Pushes an "initial" snapshot to the new subscriber before it can see any broadcast.
        SubscriberId Subscribe(std::shared_ptr<Subscriber> subscriber);
        void Unsubscribe(SubscriberId id);

        void Broadcast(const std::string &kind, const std::vector<uint8_t> &body);

        void BroadcastSnapshot(const std::string &kind);
        void BroadcastStatusChange(const StatusChange &change);

        size_t SubscriberCount() const;

    private:
        static FrameRef BuildEventFrame(const std::string &kind, const std::vector<uint8_t> &body);
        void DeliverTo(SubscriberId id, Subscriber &subscriber, const FrameRef &frame);
        // Caller holds m_mutex.
        void DeliverToAll(const FrameRef &frame);

        const DeviceStore &m_store;

        mutable std::mutex m_mutex;
        std::map<SubscriberId, std::shared_ptr<Subscriber>> m_subscribers;
        SubscriberId m_next_id = 1;
    };
}
