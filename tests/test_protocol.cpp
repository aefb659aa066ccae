#include <doctest/doctest.h>
#include "common/Codec.hpp"
#include "common/FrameBuffer.hpp"
#include "common/Messages.hpp"
#include "common/protocol.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

using namespace lan_sentry::common;
using lan_sentry::protocol::MessageType;

static DeviceRecord make_record(const std::string& ip, DeviceStatus status) {
    DeviceRecord r;
    r.address = ip;
    r.link_address = "aa:bb:cc:dd:ee:ff";
    r.name = "host-" + ip;
    r.device_class = DeviceClass::Computer;
    r.status = status;
    r.last_seen = FromEpochMillis(1700000000123ULL);
    r.last_response_ms = 2.25;
    return r;
}

TEST_CASE("BuildFrame writes a big-endian header in front of the payload") {
    auto frame = lan_sentry::protocol::BuildFrame(MessageType::PingReq, {0xAA, 0xBB});

    REQUIRE(frame.size() == lan_sentry::protocol::HEADER_SIZE + 2);
    CHECK(frame[0] == 0x4C);
    CHECK(frame[1] == 0x53);
    CHECK(frame[2] == 0x16);
    CHECK(frame[3] == 0);
    CHECK(frame[6] == 2);
    CHECK(frame[7] == 0);
    CHECK(frame[8] == 0xAA);
    CHECK(frame[9] == 0xBB);
}

TEST_CASE("BuildFrame refuses payloads over the protocol limit") {
    std::vector<uint8_t> big(lan_sentry::protocol::MAX_PAYLOAD_LENGTH + 1);
    CHECK_THROWS_AS(lan_sentry::protocol::BuildFrame(MessageType::ScanResp, big), std::length_error);
}

TEST_CASE("FrameBuffer reassembles a frame delivered one byte at a time") {
    auto frame = lan_sentry::protocol::BuildFrame(MessageType::DeviceDetailReq, EncodeAddress("10.0.0.7"));

    FrameBuffer buffer;
    Frame out;
    for (size_t i = 0; i + 1 < frame.size(); ++i) {
        buffer.Append(&frame[i], 1);
        CHECK(buffer.TryExtract(out) == FrameStatus::Incomplete);
    }
    buffer.Append(&frame.back(), 1);

    REQUIRE(buffer.TryExtract(out) == FrameStatus::Ready);
    CHECK(out.type == MessageType::DeviceDetailReq);
    std::string ip;
    CHECK(DecodeAddress(out.payload, ip));
    CHECK(ip == "10.0.0.7");
    CHECK(buffer.Size() == 0);
}

TEST_CASE("FrameBuffer splits two frames that arrive together") {
    auto a = lan_sentry::protocol::BuildFrame(MessageType::ScanReq, {});
    auto b = lan_sentry::protocol::BuildFrame(MessageType::DeviceListReq, {});
    a.insert(a.end(), b.begin(), b.end());

    FrameBuffer buffer;
    buffer.Append(a.data(), a.size());

    Frame out;
    REQUIRE(buffer.TryExtract(out) == FrameStatus::Ready);
    CHECK(out.type == MessageType::ScanReq);
    CHECK(out.payload.empty());
    REQUIRE(buffer.TryExtract(out) == FrameStatus::Ready);
    CHECK(out.type == MessageType::DeviceListReq);
    CHECK(buffer.TryExtract(out) == FrameStatus::Incomplete);
}

TEST_CASE("FrameBuffer flags bad magic and oversized lengths") {
    Frame out;

    SUBCASE("bad magic") {
        uint8_t junk[lan_sentry::protocol::HEADER_SIZE] = {'G', 'E', 'T', ' ', '/', ' ', 'H', 'T'};
        FrameBuffer buffer;
        buffer.Append(junk, sizeof(junk));
        CHECK(buffer.TryExtract(out) == FrameStatus::Malformed);
    }

    SUBCASE("length beyond limit") {
        lan_sentry::protocol::Header hdr{lan_sentry::protocol::EXPECTED_MAGIC,
                                         static_cast<uint8_t>(MessageType::ScanReq),
                                         lan_sentry::protocol::MAX_PAYLOAD_LENGTH + 1, 0};
        uint8_t raw[lan_sentry::protocol::HEADER_SIZE];
        lan_sentry::protocol::SerializeHeader(hdr, raw);

        FrameBuffer buffer;
        buffer.Append(raw, sizeof(raw));
        CHECK(buffer.TryExtract(out) == FrameStatus::Malformed);
    }
}

TEST_CASE("Device list payload carries every field") {
    std::vector<DeviceRecord> devices = {make_record("192.168.1.5", DeviceStatus::Online),
                                         make_record("192.168.1.9", DeviceStatus::Offline)};
    devices[1].device_class = DeviceClass::SmartTV;
    devices[1].link_address = UNKNOWN_LINK_ADDRESS;

    auto body = EncodeDeviceListBody(devices);

    std::vector<DeviceRecord> decoded;
    size_t offset = 0;
    REQUIRE(ReadDeviceList(body, offset, decoded));
    CHECK(offset == body.size());
    REQUIRE(decoded.size() == 2);

    CHECK(decoded[0].address == "192.168.1.5");
    CHECK(decoded[0].name == "host-192.168.1.5");
    CHECK(decoded[0].status == DeviceStatus::Online);
    CHECK(ToEpochMillis(decoded[0].last_seen) == 1700000000123ULL);
    CHECK(decoded[0].last_response_ms == doctest::Approx(2.25));

    CHECK(decoded[1].device_class == DeviceClass::SmartTV);
    CHECK(decoded[1].link_address == "Unknown");
    CHECK(decoded[1].status == DeviceStatus::Offline);
}

TEST_CASE("Truncated or out-of-range device bytes are rejected") {
    auto body = EncodeDeviceListBody({make_record("192.168.1.5", DeviceStatus::Online)});

    std::vector<DeviceRecord> decoded;
    size_t offset = 0;

    std::vector<uint8_t> cut(body.begin(), body.end() - 1);
    CHECK_FALSE(ReadDeviceList(cut, offset, decoded));
    CHECK(offset == 0);

    // class byte sits right after the three strings
    std::vector<uint8_t> bad_class = body;
    size_t class_pos = 4;
    for (int i = 0; i < 3; ++i) {
        uint32_t len = 0;
        size_t p = class_pos;
        REQUIRE(lan_sentry::common::wire::read_u32_be(bad_class, p, len));
        class_pos = p + len;
    }
    bad_class[class_pos] = 0x42;
    CHECK_FALSE(ReadDeviceList(bad_class, offset, decoded));
}

TEST_CASE("Status-change event decodes to the change, not a list") {
    StatusChange change{"192.168.1.40", DeviceStatus::Offline, FromEpochMillis(1234567ULL)};
    auto payload = EncodeEvent(EVENT_STATUS_CHANGE, EncodeStatusChangeBody(change));

    DeviceEvent event;
    REQUIRE(DecodeDeviceEvent(payload, event));
    CHECK(event.kind == "status-change");
    REQUIRE(event.change.has_value());
    CHECK(event.change->address == "192.168.1.40");
    CHECK(event.change->status == DeviceStatus::Offline);
    CHECK(ToEpochMillis(event.change->last_seen) == 1234567ULL);
    CHECK(event.devices.empty());
}

TEST_CASE("Out-of-range lastSeen saturates instead of overflowing") {
    std::vector<uint8_t> body;
    wire::append_string(body, "192.168.1.40");
    wire::append_u8(body, 0);
    wire::append_u64_be(body, UINT64_MAX);

    DeviceEvent event;
    REQUIRE(DecodeDeviceEvent(EncodeEvent(EVENT_STATUS_CHANGE, body), event));
    REQUIRE(event.change.has_value());
    CHECK(event.change->last_seen == FromEpochMillis(UINT64_MAX));
    CHECK(event.change->last_seen > Clock::now());
    CHECK(ToEpochMillis(event.change->last_seen) ==
          static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count()));
    CHECK_FALSE(FormatTimestamp(event.change->last_seen).empty());
}

TEST_CASE("Address requests reject trailing bytes") {
    auto payload = EncodeAddress("192.168.1.1");
    payload.push_back(0);

    std::string ip;
    CHECK_FALSE(DecodeAddress(payload, ip));
    CHECK_FALSE(DecodeAddress({}, ip));
}

TEST_CASE("Error payload keeps code and message") {
    auto payload = EncodeError(lan_sentry::protocol::ErrorCode::ScanInProgress, "Scan already in progress");

    ErrorInfo error;
    REQUIRE(DecodeError(payload, error));
    CHECK(error.code == lan_sentry::protocol::ErrorCode::ScanInProgress);
    CHECK(error.message == "Scan already in progress");
}

TEST_CASE("Timestamps render as local time, the epoch as never") {
    CHECK(FormatTimestamp(Clock::time_point{}) == "never");
    CHECK(FormatTimestamp(Clock::now()).size() == 19);
}

TEST_CASE("TxBuffer hands out bytes in order across partial writes") {
    TxBuffer tx;
    std::vector<uint8_t> bytes(10000);
    for (size_t i = 0; i < bytes.size(); ++i)
        bytes[i] = static_cast<uint8_t>(i % 251);
    tx.Append(bytes.data(), bytes.size());

    size_t written = 0;
    while (!tx.Empty()) {
        size_t n = std::min<size_t>(tx.Size(), 333);
        REQUIRE(std::equal(tx.Data(), tx.Data() + n, bytes.begin() + static_cast<std::ptrdiff_t>(written)));
        tx.Consume(n);
        written += n;
        CHECK(tx.Size() == bytes.size() - written);
        // written bytes never pile up past the pending ones
        CHECK(tx.Retained() - tx.Size() <= tx.Size());
    }

    CHECK(written == bytes.size());
    CHECK(tx.Retained() == 0);
}

TEST_CASE("TxBuffer keeps pending bytes when more are appended mid-flush") {
    TxBuffer tx;
    const uint8_t first[] = {1, 2, 3, 4};
    const uint8_t second[] = {5, 6};
    tx.Append(first, sizeof(first));
    tx.Consume(1);
    tx.Append(second, sizeof(second));

    REQUIRE(tx.Size() == 5);
    CHECK(std::vector<uint8_t>(tx.Data(), tx.Data() + tx.Size()) == std::vector<uint8_t>{2, 3, 4, 5, 6});

    tx.Consume(100);
    CHECK(tx.Empty());
    CHECK(tx.Retained() == 0);
}
