/**
 * @file FieldDescriptor.cpp
 * @brief Non-virtual parts of the FieldDescriptor interface.
 */

#include "binform/FieldDescriptor.hpp"

namespace binform
{

Value FieldDescriptor::decodeField(ByteSource& source, const Context& context, ByteOrder inherited) const
{
    Value value = decode(source, context, inherited);
    if (m_options.transform)
    {
        value = m_options.transform(std::move(value));
    }
    return value;
}

Decoded FieldDescriptor::read(ByteSource& source, const Context& context, ByteOrder inherited) const
{
    const std::size_t start = source.position();
    Value value = decodeField(source, context, inherited);
    return Decoded{std::move(value), source.position() - start};
}

Decoded FieldDescriptor::read(std::span<const std::uint8_t> data, const Context& context) const
{
    BufferSource source(data);
    return read(source, context);
}

} // namespace binform
