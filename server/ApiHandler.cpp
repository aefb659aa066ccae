#include "ApiHandler.hpp"
#include "Errors.hpp"
#include "../common/Ipv4.hpp"
#include "../common/Messages.hpp"

#include <bitset>
#include <iostream>
#include <stdexcept>

namespace lan_sentry::server
{
    using lan_sentry::protocol::ErrorCode;
    using lan_sentry::protocol::MessageType;

    namespace
    {
        std::string DescribeUnsupportedRange(const NetworkTopology &topology)
        {
            auto address = lan_sentry::common::ParseIpv4(topology.address);
            auto netmask = lan_sentry::common::ParseIpv4(topology.netmask);
            if (!address || !netmask)
                return "";

            std::bitset<32> bits(*netmask);
            return lan_sentry::common::FormatIpv4(*address & *netmask) + "/" + std::to_string(bits.count());
        }
    }

    ApiHandler::ApiHandler(TopologyResolver &resolver, SweepCoordinator &sweeper, DeviceStore &store,
                           PingService &pinger, MetricsStub &metrics)
        : m_resolver(resolver), m_sweeper(sweeper), m_store(store), m_pinger(pinger), m_metrics(metrics)
    {
    }

    Response ApiHandler::Handle(MessageType type, const std::vector<uint8_t> &payload)
    {
        return Guarded(type, [&]() -> Response
        {
            switch (type)
            {
            case MessageType::NetworkInfoReq:
                return HandleNetworkInfo();
            case MessageType::ScanReq:
                return HandleScan(m_sweeper.Reserve());
            case MessageType::DeviceListReq:
                return HandleDeviceList();
            case MessageType::DeviceDetailReq:
                return HandleDeviceDetail(payload);
            case MessageType::PingReq:
                return HandlePing(payload);
            default:
                return Error(ErrorCode::BadRequest, std::string("Unsupported request type ") + lan_sentry::protocol::ToString(type));
            }
        });
    }

    Response ApiHandler::HandleReservedScan(SweepTicket ticket)
    {
        return Guarded(MessageType::ScanReq, [&]() { return HandleScan(std::move(ticket)); });
    }

    SweepTicket ApiHandler::ReserveScan()
    {
        return m_sweeper.Reserve();
    }

    Response ApiHandler::Guarded(MessageType type, const std::function<Response()> &operation)
    {
        try
        {
            return operation();
        }
        catch (const SweepInProgressError &e)
        {
            return Error(ErrorCode::ScanInProgress, e.what());
        }
        catch (const NoNetworkError &e)
        {
            return Error(ErrorCode::NoNetwork, e.what());
        }
        catch (const UnsupportedRangeError &e)
        {
            return Error(ErrorCode::UnsupportedRange, e.what());
        }
        catch (const std::invalid_argument &e)
        {
            return Error(ErrorCode::BadRequest, e.what());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Worker] " << lan_sentry::protocol::ToString(type) << " failed: " << e.what() << "\n";
            return Error(ErrorCode::Internal, e.what());
        }
    }

    Response ApiHandler::HandleNetworkInfo()
    {
        NetworkTopology topology = m_resolver.Resolve();

        lan_sentry::common::NetworkInfo info;
        info.address = topology.address;
        info.netmask = topology.netmask;

        try
        {
            info.range = TopologyResolver::DeriveSweepRange(topology).cidr;
            info.range_supported = true;
        }
        catch (const UnsupportedRangeError &)
        {
            info.range = DescribeUnsupportedRange(topology);
            info.range_supported = false;
        }

        return {MessageType::NetworkInfoResp, lan_sentry::common::EncodeNetworkInfo(info)};
    }

    Response ApiHandler::HandleScan(SweepTicket ticket)
    {
        SweepReport report = m_sweeper.Sweep(std::move(ticket));

        lan_sentry::common::ScanSummary summary;
        summary.range = report.range.cidr;
        summary.devices = std::move(report.devices);

        return {MessageType::ScanResp, lan_sentry::common::EncodeScanSummary(summary)};
    }

    Response ApiHandler::HandleDeviceList()
    {
        return {MessageType::DeviceListResp, lan_sentry::common::EncodeDeviceListBody(m_store.Snapshot())};
    }

    Response ApiHandler::HandleDeviceDetail(const std::vector<uint8_t> &payload)
    {
        std::string ip;
        if (!lan_sentry::common::DecodeAddress(payload, ip))
            return Error(ErrorCode::BadRequest, "Invalid payload format");

        auto device = m_store.Get(ip);
        if (!device)
            return Error(ErrorCode::NotFound, "Device not found");

        lan_sentry::common::DeviceDetail detail;
        detail.device = std::move(*device);
        detail.metrics = m_metrics.Sample();

        return {MessageType::DeviceDetailResp, lan_sentry::common::EncodeDeviceDetail(detail)};
    }

    Response ApiHandler::HandlePing(const std::vector<uint8_t> &payload)
    {
        std::string ip;
        if (!lan_sentry::common::DecodeAddress(payload, ip))
            return Error(ErrorCode::BadRequest, "Invalid payload format");
        if (!lan_sentry::common::IsValidIpv4(ip))
            return Error(ErrorCode::BadRequest, "Invalid IPv4 address '" + ip + "'");

        try
        {
            auto report = m_pinger.Ping(ip);
            return {MessageType::PingResp, lan_sentry::common::EncodePingReport(report)};
        }
        catch (const std::invalid_argument &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            return Error(ErrorCode::ProbeFailed, e.what());
        }
    }

    Response ApiHandler::Error(ErrorCode code, const std::string &message)
    {
        return {MessageType::ErrorResp, lan_sentry::common::EncodeError(code, message)};
    }
}
