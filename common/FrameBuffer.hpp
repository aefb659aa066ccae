#pragma once

#include <cstdint>
#include <vector>
#include <cstring>
#include "protocol.hpp"

namespace lan_sentry::common
{
    struct Frame
    {
        lan_sentry::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    enum class FrameStatus
    {
        Ready,
        Incomplete,
        Malformed
    };

    // Reassembles frames from a byte stream that may arrive in arbitrary pieces.
    class FrameBuffer
    {
    private:
        std::vector<uint8_t> m_buffer;

    public:
        FrameBuffer() = default;

        void Append(const uint8_t *data, size_t size);

        // Malformed means a bad magic or an oversized length; the stream cannot be resynchronised.
        FrameStatus TryExtract(Frame &out);

        void Clear() { m_buffer.clear(); }
        size_t Size() const { return m_buffer.size(); }
    };

    // Outgoing bytes waiting for the socket. Written bytes are skipped by offset and
    // the front is only reclaimed once it is at least half the storage.
    class TxBuffer
    {
    private:
        std::vector<uint8_t> m_buffer;
        size_t m_offset = 0;

    public:
        void Append(const uint8_t *data, size_t size);

        // Marks the first n pending bytes as written; n is capped at Size().
        void Consume(size_t n);

        const uint8_t *Data() const { return m_buffer.data() + m_offset; }
        size_t Size() const { return m_buffer.size() - m_offset; }
        bool Empty() const { return Size() == 0; }

        // Bytes held in storage, written ones included.
        size_t Retained() const { return m_buffer.size(); }
    };

}
