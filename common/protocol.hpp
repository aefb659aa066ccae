#pragma once

#include <cstdint>
#include <vector>
#include <cstddef>

namespace lan_sentry::protocol
{

    inline constexpr uint16_t EXPECTED_MAGIC = 0x4C53; // "LS"
    inline constexpr uint32_t MAX_PAYLOAD_LENGTH = 10 * 1024 * 1024; // 10MB
    inline constexpr size_t HEADER_SIZE = 8;

    struct Header
    {
        uint16_t magic;
        uint8_t msg_type;
        uint32_t payload_length;
        uint8_t reserved;
    };

    enum class MessageType : std::uint8_t
    {
        NetworkInfoReq = 0x01,
        NetworkInfoResp = 0x02,

        ScanReq = 0x10,
        ScanResp = 0x11,
        DeviceListReq = 0x12,
        DeviceListResp = 0x13,
        DeviceDetailReq = 0x14,
        DeviceDetailResp = 0x15,
        PingReq = 0x16,
        PingResp = 0x17,

        SubscribeReq = 0x20,
        SubscribeResp = 0x21,
        DeviceEvent = 0x22,

        ErrorResp = 0xFF
    };

    enum class ErrorCode : std::uint8_t
    {
        BadRequest = 1,
        NoNetwork = 2,
        UnsupportedRange = 3,
        ScanInProgress = 4,
        NotFound = 5,
        ProbeFailed = 6,
        Internal = 7
    };

    const char *ToString(MessageType type);
    const char *ToString(ErrorCode code);

    inline void SerializeHeader(const Header& hdr, std::uint8_t* buffer)
    {
        buffer[0] = static_cast<uint8_t>((hdr.magic >> 8) & 0xFF);
        buffer[1] = static_cast<uint8_t>(hdr.magic & 0xFF);

        buffer[2] = hdr.msg_type;

        buffer[3] = static_cast<uint8_t>((hdr.payload_length >> 24) & 0xFF);
        buffer[4] = static_cast<uint8_t>((hdr.payload_length >> 16) & 0xFF);
        buffer[5] = static_cast<uint8_t>((hdr.payload_length >> 8) & 0xFF);
        buffer[6] = static_cast<uint8_t>(hdr.payload_length & 0xFF);

        buffer[7] = hdr.reserved;
    }

    inline Header DeserializeHeader(const std::uint8_t* buffer)
    {
        Header hdr;

        hdr.magic = (static_cast<uint16_t>(buffer[0]) << 8) |
                     static_cast<uint16_t>(buffer[1]);

        hdr.msg_type = buffer[2];

        hdr.payload_length = (static_cast<uint32_t>(buffer[3]) << 24) |
                             (static_cast<uint32_t>(buffer[4]) << 16) |
                             (static_cast<uint32_t>(buffer[5]) << 8)  |
                             static_cast<uint32_t>(buffer[6]);

        hdr.reserved = buffer[7];

        return hdr;
    }

    // Header followed by payload, ready to be written to a socket.
    std::vector<uint8_t> BuildFrame(MessageType type, const std::vector<uint8_t> &payload);

}
