/**
 * @file Errors.cpp
 * @brief Implementation of the binform exception classes.
 */

#include "binform/Errors.hpp"

namespace binform
{

Error::Error(const std::string& message)
    : std::runtime_error(message), m_message(message)
{
    rebuild();
}

const char* Error::what() const noexcept
{
    return m_what.c_str();
}

void Error::prependField(std::string_view name)
{
    if (name.empty()) return;

    if (m_path.empty())
    {
        m_path = std::string(name);
    }
    else
    {
        m_path = std::string(name) + "." + m_path;
    }
    rebuild();
}

void Error::rebuild()
{
    m_what = m_path.empty() ? m_message : m_path + ": " + m_message;
}

InsufficientData::InsufficientData(std::size_t requested, std::size_t available, std::size_t position)
    : Error("not enough bytes: requested " + std::to_string(requested) +
            " at offset " + std::to_string(position) +
            ", " + std::to_string(available) + " available"),
      m_requested(requested),
      m_available(available),
      m_position(position)
{
}

UnresolvedReference::UnresolvedReference(const std::string& name)
    : Error("unresolved reference to field '" + name + "'"), m_reference(name)
{
}

TrailingData::TrailingData(std::size_t position)
    : Error("left over bytes after offset " + std::to_string(position))
{
}

InvalidEncoding::InvalidEncoding(const std::string& encoding, std::size_t offset)
    : Error("invalid " + encoding + " byte sequence at offset " + std::to_string(offset)),
      m_encoding(encoding)
{
}

} // namespace binform
