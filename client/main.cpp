#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ClientNetwork.hpp"
#include "ConsoleView.hpp"
#include "../common/Ipv4.hpp"
#include "../common/Messages.hpp"
#include "../common/protocol.hpp"

namespace
{
    using lan_sentry::protocol::MessageType;

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_CONNECTION = 2;
    constexpr int EXIT_SERVER_ERROR = 3;

    // A full sweep waits for every probe, so it gets the longest deadline.
    constexpr int SCAN_TIMEOUT_MS = 180000;
    constexpr int PING_TIMEOUT_MS = 60000;
    constexpr int REQUEST_TIMEOUT_MS = 10000;

    struct CliOptions
    {
        std::string host = "127.0.0.1";
        int port = 8080;
        std::string command;
        std::string argument;
    };

    void PrintUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " [--host H] [--port P] <command>\n"
                  << "Commands:\n"
                  << "  info           show the server's network and sweep range\n"
                  << "  scan           sweep the subnet and list responding devices\n"
                  << "  devices        list every known device\n"
                  << "  device <ip>    show one device with its metrics\n"
                  << "  ping <ip>      probe one address on demand\n"
                  << "  watch          follow device events until the server disconnects\n";
    }

    bool ParseArgs(int argc, char *argv[], CliOptions &opts)
    {
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--host" || arg == "--port")
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Missing value for " << arg << "\n";
                    return false;
                }
                std::string value = argv[++i];
                if (arg == "--host")
                {
                    opts.host = value;
                    continue;
                }
                try
                {
                    size_t consumed = 0;
                    opts.port = std::stoi(value, &consumed);
                    if (consumed != value.size() || opts.port < 1 || opts.port > 65535)
                        throw std::out_of_range(value);
                }
                catch (const std::exception &)
                {
                    std::cerr << "Invalid port '" << value << "'\n";
                    return false;
                }
                continue;
            }
            positional.push_back(arg);
        }

        if (positional.empty())
            return false;

        opts.command = positional[0];

        if (opts.command == "device" || opts.command == "ping")
        {
            if (positional.size() != 2)
                return false;
            opts.argument = positional[1];
            if (!lan_sentry::common::IsValidIpv4(opts.argument))
            {
                std::cerr << "Invalid IPv4 address '" << opts.argument << "'\n";
                return false;
            }
            return true;
        }

        if (opts.command == "info" || opts.command == "scan" || opts.command == "devices" || opts.command == "watch")
            return positional.size() == 1;

        std::cerr << "Unknown command '" << opts.command << "'\n";
        return false;
    }

    // Checks for ErrorResp and the expected type. Returns an exit code, EXIT_OK to continue.
    int CheckResponse(const lan_sentry::common::Frame &frame, MessageType expected)
    {
        if (frame.type == MessageType::ErrorResp)
        {
            lan_sentry::common::ErrorInfo error;
            if (!lan_sentry::common::DecodeError(frame.payload, error))
            {
                std::cerr << "[Client] Undecodable error response.\n";
                return EXIT_SERVER_ERROR;
            }
            lan_sentry::client::PrintError(std::cerr, error);
            return EXIT_SERVER_ERROR;
        }

        if (frame.type != expected)
        {
            std::cerr << "[Client] Unexpected response " << lan_sentry::protocol::ToString(frame.type)
                      << ", wanted " << lan_sentry::protocol::ToString(expected) << "\n";
            return EXIT_SERVER_ERROR;
        }
        return EXIT_OK;
    }

    int Malformed(MessageType type)
    {
        std::cerr << "[Client] Malformed " << lan_sentry::protocol::ToString(type) << " payload.\n";
        return EXIT_SERVER_ERROR;
    }

    int RunRequest(lan_sentry::client::ClientNetwork &net, const CliOptions &opts)
    {
        using namespace lan_sentry::common;
        using namespace lan_sentry::client;

        MessageType request = MessageType::NetworkInfoReq;
        MessageType expected = MessageType::NetworkInfoResp;
        std::vector<uint8_t> payload;
        int timeout_ms = REQUEST_TIMEOUT_MS;

        if (opts.command == "scan")
        {
            request = MessageType::ScanReq;
            expected = MessageType::ScanResp;
            timeout_ms = SCAN_TIMEOUT_MS;
        }
        else if (opts.command == "devices")
        {
            request = MessageType::DeviceListReq;
            expected = MessageType::DeviceListResp;
        }
        else if (opts.command == "device")
        {
            request = MessageType::DeviceDetailReq;
            expected = MessageType::DeviceDetailResp;
            payload = EncodeAddress(opts.argument);
        }
        else if (opts.command == "ping")
        {
            request = MessageType::PingReq;
            expected = MessageType::PingResp;
            payload = EncodeAddress(opts.argument);
            timeout_ms = PING_TIMEOUT_MS;
        }

        if (!net.SendRequest(request, payload))
        {
            std::cerr << "[Client] Failed to send " << lan_sentry::protocol::ToString(request) << "\n";
            return EXIT_CONNECTION;
        }

        Frame frame;
        if (!net.ReadNextPacket(frame, timeout_ms))
        {
            std::cerr << "[Client] No response from server.\n";
            return EXIT_CONNECTION;
        }

        int rc = CheckResponse(frame, expected);
        if (rc != EXIT_OK)
            return rc;

        switch (expected)
        {
        case MessageType::NetworkInfoResp:
        {
            NetworkInfo info;
            if (!DecodeNetworkInfo(frame.payload, info))
                return Malformed(frame.type);
            PrintNetworkInfo(std::cout, info);
            break;
        }
        case MessageType::ScanResp:
        {
            ScanSummary summary;
            if (!DecodeScanSummary(frame.payload, summary))
                return Malformed(frame.type);
            PrintScanSummary(std::cout, summary);
            break;
        }
        case MessageType::DeviceListResp:
        {
            std::vector<DeviceRecord> devices;
            size_t offset = 0;
            if (!ReadDeviceList(frame.payload, offset, devices) || offset != frame.payload.size())
                return Malformed(frame.type);
            PrintDeviceTable(std::cout, devices);
            break;
        }
        case MessageType::DeviceDetailResp:
        {
            DeviceDetail detail;
            if (!DecodeDeviceDetail(frame.payload, detail))
                return Malformed(frame.type);
            PrintDeviceDetail(std::cout, detail);
            break;
        }
        case MessageType::PingResp:
        {
            PingReport report;
            if (!DecodePingReport(frame.payload, report))
                return Malformed(frame.type);
            PrintPingReport(std::cout, opts.argument, report);
            break;
        }
        default:
            return Malformed(frame.type);
        }

        return EXIT_OK;
    }

    int RunWatch(lan_sentry::client::ClientNetwork &net)
    {
        using namespace lan_sentry::common;

        if (!net.SendRequest(MessageType::SubscribeReq, {}))
        {
            std::cerr << "[Client] Failed to subscribe.\n";
            return EXIT_CONNECTION;
        }

        Frame frame;
        while (net.ReadNextPacket(frame, -1))
        {
            if (frame.type == MessageType::SubscribeResp)
            {
                std::cout << "[Client] Subscribed. Waiting for events...\n";
                continue;
            }

            if (frame.type == MessageType::DeviceEvent)
            {
                DeviceEvent event;
                if (!DecodeDeviceEvent(frame.payload, event))
                    return Malformed(frame.type);
                lan_sentry::client::PrintEvent(std::cout, event);
                std::cout.flush();
                continue;
            }

            int rc = CheckResponse(frame, MessageType::DeviceEvent);
            if (rc != EXIT_OK)
                return rc;
        }

        return EXIT_OK;
    }
}

int main(int argc, char *argv[])
{
    CliOptions opts;
    if (!ParseArgs(argc, argv, opts))
    {
        PrintUsage(argv[0]);
        return EXIT_USAGE;
    }

    try
    {
        lan_sentry::client::ClientNetwork net(opts.host, opts.port);
        if (!net.Connect())
            return EXIT_CONNECTION;

        if (opts.command == "watch")
            return RunWatch(net);

        return RunRequest(net, opts);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Client Error: " << e.what() << '\n';
        return EXIT_CONNECTION;
    }
}
