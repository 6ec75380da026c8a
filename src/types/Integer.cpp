/**
 * @file Integer.cpp
 * @brief Implementation of the Integer, Bool and Char decoders.
 */

#include "binform/types/Integer.hpp"
#include "binform/Errors.hpp"
#include "utils/BinaryIO.hpp"
#include "utils/TextCodec.hpp"

#include <algorithm>

namespace binform
{
    Integer::Integer(std::size_t width, bool isSigned, FieldOptions options)
        : FieldDescriptor(std::move(options)), m_width(width), m_signed(isSigned)
    {
        if (m_width == 0)
        {
            throw InvalidConfiguration("integer width must be at least one byte");
        }
    }

    Value Integer::decode(ByteSource& source, const Context& /*context*/, ByteOrder inherited) const
    {
        const ByteOrder order = resolveByteOrder(inherited);
        ByteString raw = source.readExact(m_width);

        if (m_width <= 8)
        {
            uint64_t v = utils::readUnsigned(raw.data(), m_width, order);
            if (m_signed) return Value(utils::signExtend(v, m_width));
            return Value(v);
        }

        // Wider than 64 bits: keep the bytes, normalised to little-endian.
        if (order == ByteOrder::Big)
        {
            std::reverse(raw.begin(), raw.end());
        }
        return Value(WideInt(std::move(raw), m_signed));
    }

    std::string Integer::typeName() const
    {
        return (m_signed ? "i" : "u") + std::to_string(m_width * 8);
    }

    Value Bool::decode(ByteSource& source, const Context& context, ByteOrder inherited) const
    {
        Value raw = Integer::decode(source, context, inherited);
        return Value(raw.toUInt64().value_or(0) != 0);
    }

    Value Char::decode(ByteSource& source, const Context& context, ByteOrder inherited) const
    {
        Value raw = Integer::decode(source, context, inherited);
        std::string text;
        utils::appendUtf8(text, static_cast<uint32_t>(raw.toUInt64().value_or(0)));
        return Value(std::move(text));
    }

} // namespace binform
