#include "ChangeNotifier.hpp"
#include "../common/Messages.hpp"
#include "../common/protocol.hpp"

#include <iostream>

namespace lan_sentry::server
{
    ChangeNotifier::ChangeNotifier(const DeviceStore &store) : m_store(store)
    {
    }

    FrameRef ChangeNotifier::BuildEventFrame(const std::string &kind, const std::vector<uint8_t> &body)
    {
        auto payload = lan_sentry::common::EncodeEvent(kind, body);
        return std::make_shared<const std::vector<uint8_t>>(
            lan_sentry::protocol::BuildFrame(lan_sentry::protocol::MessageType::DeviceEvent, payload));
    }

    SubscriberId ChangeNotifier::Subscribe(std::shared_ptr<Subscriber> subscriber)
    {
        if (!subscriber)
            return 0;

        std::lock_guard<std::mutex> lock(m_mutex);

        SubscriberId id = m_next_id++;

        auto body = lan_sentry::common::EncodeDeviceListBody(m_store.Snapshot());
        DeliverTo(id, *subscriber, BuildEventFrame(lan_sentry::common::EVENT_INITIAL, body));

        m_subscribers[id] = std::move(subscriber);
        std::cout << "[Notifier] Subscriber " << id << " connected (" << m_subscribers.size() << " total)\n";
        return id;
    }

    void ChangeNotifier::Unsubscribe(SubscriberId id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_subscribers.erase(id) > 0)
        {
            std::cout << "[Notifier] Subscriber " << id << " disconnected\n";
        }
    }

    void ChangeNotifier::Broadcast(const std::string &kind, const std::vector<uint8_t> &body)
    {
        FrameRef frame = BuildEventFrame(kind, body);

        std::lock_guard<std::mutex> lock(m_mutex);
        DeliverToAll(frame);
    }

    void ChangeNotifier::BroadcastSnapshot(const std::string &kind)
    {
        // Snapshot under the lock, as Subscribe does, so a subscriber never gets
        // an older snapshot after its "initial" one.
        std::lock_guard<std::mutex> lock(m_mutex);
        auto body = lan_sentry::common::EncodeDeviceListBody(m_store.Snapshot());
        DeliverToAll(BuildEventFrame(kind, body));
    }

    void ChangeNotifier::BroadcastStatusChange(const StatusChange &change)
    {
        Broadcast(lan_sentry::common::EVENT_STATUS_CHANGE, lan_sentry::common::EncodeStatusChangeBody(change));
    }

    size_t ChangeNotifier::SubscriberCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

    void ChangeNotifier::DeliverToAll(const FrameRef &frame)
    {
        for (auto &entry : m_subscribers)
        {
            DeliverTo(entry.first, *entry.second, frame);
        }
    }

    void ChangeNotifier::DeliverTo(SubscriberId id, Subscriber &subscriber, const FrameRef &frame)
    {
        try
        {
            if (subscriber.IsWritable())
                subscriber.Deliver(frame);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Notifier] Delivery to subscriber " << id << " failed: " << e.what() << "\n";
        }
    }
}
