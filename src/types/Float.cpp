/**
 * @file Float.cpp
 * @brief Implementation of the Float decoder.
 */

#include "binform/types/Float.hpp"
#include "binform/Errors.hpp"
#include "utils/BinaryIO.hpp"

#include <array>

namespace binform
{
    Float::Float(std::size_t width, FieldOptions options)
        : FieldDescriptor(std::move(options)), m_width(width)
    {
        if (m_width != 2 && m_width != 4 && m_width != 8)
        {
            throw InvalidConfiguration(
                "invalid float size " + std::to_string(width) + ", must be either 2, 4 or 8"
            );
        }
    }

    Value Float::decode(ByteSource& source, const Context& /*context*/, ByteOrder inherited) const
    {
        std::array<uint8_t, 8> b{};
        source.readFully(b.data(), m_width);
        return Value(utils::readIeee(b.data(), m_width, resolveByteOrder(inherited)));
    }

} // namespace binform
