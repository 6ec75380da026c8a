/**
 * @file ByteSource.cpp
 * @brief Implementation of the buffer and stream byte sources.
 */

#include "binform/ByteSource.hpp"
#include "binform/Errors.hpp"
#include "utils/Logging.hpp"

#include <algorithm>
#include <cstring> // For std::memcpy

namespace binform
{

// --- ByteSource ---

namespace
{
    // Stream read granularity; bounds look-ahead growth for untrusted lengths.
    constexpr std::size_t kStreamChunk = 64 * 1024;
}

ByteString ByteSource::readExact(std::size_t n)
{
    checkAvailable(n);
    ByteString out(n);
    readFully(out.data(), n);
    return out;
}

// --- BufferSource ---

BufferSource::BufferSource(std::span<const std::uint8_t> data)
    : m_view(data)
{
}

BufferSource::BufferSource(ByteString data)
    : m_owned(std::move(data)), m_owning(true)
{
    m_view = m_owned;
}

BufferSource::BufferSource(std::string_view data)
    : m_owned(data.begin(), data.end()), m_owning(true)
{
    m_view = m_owned;
}

BufferSource::BufferSource(const BufferSource& other)
    : m_owned(other.m_owned),
      m_view(other.m_view),
      m_owning(other.m_owning),
      m_pos(other.m_pos)
{
    if (m_owning) m_view = m_owned;
}

BufferSource& BufferSource::operator=(const BufferSource& other)
{
    if (this == &other) return *this;

    m_owned = other.m_owned;
    m_owning = other.m_owning;
    m_view = m_owning ? std::span<const std::uint8_t>(m_owned) : other.m_view;
    m_pos = other.m_pos;
    return *this;
}

void BufferSource::checkBounds(std::size_t n) const
{
    std::size_t available = m_view.size() - m_pos;
    if (n > available)
    {
        throw InsufficientData(n, available, m_pos);
    }
}

void BufferSource::readFully(std::uint8_t* buffer, std::size_t n)
{
    checkBounds(n);
    if (n > 0) std::memcpy(buffer, m_view.data() + m_pos, n);
    m_pos += n;
}

void BufferSource::skip(std::size_t n)
{
    checkBounds(n);
    m_pos += n;
}

// --- StreamSource ---

StreamSource::StreamSource(std::istream& stream)
    : m_stream(stream)
{
}

void StreamSource::fill(std::size_t n)
{
    while (m_pending.size() < n && m_stream.good())
    {
        const std::size_t have = m_pending.size();
        const std::size_t want = std::min(n - have, kStreamChunk);
        m_pending.resize(have + want);
        m_stream.read(reinterpret_cast<char*>(m_pending.data() + have),
                      static_cast<std::streamsize>(want));
        m_pending.resize(have + static_cast<std::size_t>(m_stream.gcount()));

        if (m_stream.bad())
        {
            throw Error("stream read failed at offset " + std::to_string(m_pos + m_pending.size()));
        }
        BINFORM_LOG_TRACE("stream: buffered {} byte(s) at offset {}", m_pending.size() - have, m_pos + have);
    }

    if (m_pending.size() < n)
    {
        throw InsufficientData(n, m_pending.size(), m_pos);
    }
}

void StreamSource::readFully(std::uint8_t* buffer, std::size_t n)
{
    fill(n);
    std::copy_n(m_pending.begin(), n, buffer);
    m_pending.erase(m_pending.begin(), m_pending.begin() + static_cast<std::ptrdiff_t>(n));
    m_pos += n;
}

void StreamSource::skip(std::size_t n)
{
    fill(n);
    m_pending.erase(m_pending.begin(), m_pending.begin() + static_cast<std::ptrdiff_t>(n));
    m_pos += n;
}

bool StreamSource::atEnd() const
{
    if (!m_pending.empty()) return false;
    if (!m_stream.good()) return true;
    return m_stream.peek() == std::istream::traits_type::eof();
}

} // namespace binform
