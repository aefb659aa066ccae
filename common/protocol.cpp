#include "protocol.hpp"

#include <algorithm>
#include <stdexcept>

namespace lan_sentry::protocol
{

    std::vector<uint8_t> BuildFrame(MessageType type, const std::vector<uint8_t> &payload)
    {
        if (payload.size() > MAX_PAYLOAD_LENGTH)
            throw std::length_error("BuildFrame - payload exceeds MAX_PAYLOAD_LENGTH");

        Header header;
        header.magic = EXPECTED_MAGIC;
        header.msg_type = static_cast<uint8_t>(type);
        header.payload_length = static_cast<uint32_t>(payload.size());
        header.reserved = 0;

        std::vector<uint8_t> frame(HEADER_SIZE + payload.size());
        SerializeHeader(header, frame.data());
        std::copy(payload.begin(), payload.end(), frame.begin() + HEADER_SIZE);
        return frame;
    }

    const char *ToString(MessageType type)
    {
        switch (type)
        {
        case MessageType::NetworkInfoReq: return "NetworkInfoReq";
        case MessageType::NetworkInfoResp: return "NetworkInfoResp";
        case MessageType::ScanReq: return "ScanReq";
        case MessageType::ScanResp: return "ScanResp";
        case MessageType::DeviceListReq: return "DeviceListReq";
        case MessageType::DeviceListResp: return "DeviceListResp";
        case MessageType::DeviceDetailReq: return "DeviceDetailReq";
        case MessageType::DeviceDetailResp: return "DeviceDetailResp";
        case MessageType::PingReq: return "PingReq";
        case MessageType::PingResp: return "PingResp";
        case MessageType::SubscribeReq: return "SubscribeReq";
        case MessageType::SubscribeResp: return "SubscribeResp";
        case MessageType::DeviceEvent: return "DeviceEvent";
        case MessageType::ErrorResp: return "ErrorResp";
        }
        return "Unknown";
    }

    const char *ToString(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::BadRequest: return "bad-request";
        case ErrorCode::NoNetwork: return "no-network";
        case ErrorCode::UnsupportedRange: return "unsupported-range";
        case ErrorCode::ScanInProgress: return "sweep-conflict";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::ProbeFailed: return "probe-failed";
        case ErrorCode::Internal: return "internal";
        }
        return "unknown";
    }

}
