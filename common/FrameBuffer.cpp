#include "FrameBuffer.hpp"

#include <algorithm>
#include <cstddef>

namespace lan_sentry::common
{
    void FrameBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.insert(m_buffer.end(), data, data + size);
    }

    FrameStatus FrameBuffer::TryExtract(Frame &out)
    {
        using namespace lan_sentry::protocol;

        if (m_buffer.size() < HEADER_SIZE)
            return FrameStatus::Incomplete;

        Header hdr = DeserializeHeader(m_buffer.data());

        if (hdr.magic != EXPECTED_MAGIC || hdr.payload_length > MAX_PAYLOAD_LENGTH)
            return FrameStatus::Malformed;

        if (m_buffer.size() < HEADER_SIZE + hdr.payload_length)
            return FrameStatus::Incomplete;

        auto start_it = m_buffer.begin() + HEADER_SIZE;
        auto end_it = start_it + hdr.payload_length;

        out.type = static_cast<MessageType>(hdr.msg_type);
        out.payload.assign(start_it, end_it);

        m_buffer.erase(m_buffer.begin(), end_it);
        return FrameStatus::Ready;
    }

    void TxBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.insert(m_buffer.end(), data, data + size);
    }

    void TxBuffer::Consume(size_t n)
    {
        m_offset += std::min(n, Size());

        if (m_offset == m_buffer.size())
        {
            m_buffer.clear();
            m_offset = 0;
        }
        else if (m_offset * 2 >= m_buffer.size())
        {
            m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_offset));
            m_offset = 0;
        }
    }
}
