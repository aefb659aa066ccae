#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "DeviceStore.hpp"
#include "MetricsStub.hpp"
#include "PingService.hpp"
#include "SweepCoordinator.hpp"
#include "TopologyResolver.hpp"
#include "../common/protocol.hpp"

namespace lan_sentry::server
{
    struct Response
    {
        lan_sentry::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    // Request/response operations. Handle() never throws; failures become ErrorResp.
    class ApiHandler
    {
    public:
        ApiHandler(TopologyResolver &resolver, SweepCoordinator &sweeper, DeviceStore &store,
                   PingService &pinger, MetricsStub &metrics);

        Response Handle(lan_sentry::protocol::MessageType type, const std::vector<uint8_t> &payload);

        // Scan on a slot claimed by ReserveScan() when the request arrived.
        Response HandleReservedScan(SweepTicket ticket);

        // Throws SweepInProgressError when a sweep is already running or reserved.
        SweepTicket ReserveScan();

        static Response Error(lan_sentry::protocol::ErrorCode code, const std::string &message);

    private:
        Response Guarded(lan_sentry::protocol::MessageType type, const std::function<Response()> &operation);

        Response HandleNetworkInfo();
        Response HandleScan(SweepTicket ticket);
        Response HandleDeviceList();
        Response HandleDeviceDetail(const std::vector<uint8_t> &payload);
        Response HandlePing(const std::vector<uint8_t> &payload);

        TopologyResolver &m_resolver;
        SweepCoordinator &m_sweeper;
        DeviceStore &m_store;
        PingService &m_pinger;
        MetricsStub &m_metrics;
    };
}
