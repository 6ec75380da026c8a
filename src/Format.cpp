/**
 * @file Format.cpp
 * @brief Implementation of the Format aggregate.
 */

#include "binform/Format.hpp"
#include "binform/Errors.hpp"
#include "utils/Logging.hpp"

#include <algorithm>

namespace binform
{

Format::Format(FieldList fields, FieldOptions options)
    : FieldDescriptor(std::move(options)), m_fields(std::move(fields))
{
    for (auto it = m_fields.begin(); it != m_fields.end(); ++it)
    {
        const std::string& name = it->first;
        if (name.empty())
        {
            throw InvalidConfiguration(
                "format field " + std::to_string(it - m_fields.begin()) + " has an empty name"
            );
        }
        if (!it->second)
        {
            throw InvalidConfiguration("format field '" + name + "' has no descriptor");
        }

        auto dup = std::find_if(m_fields.begin(), it,
            [&](const auto& other) { return other.first == name; });
        if (dup != it)
        {
            throw InvalidConfiguration("format field '" + name + "' is declared twice");
        }
    }
}

Context Format::decodeFields(ByteSource& source, const Context* parent, ByteOrder inherited) const
{
    const ByteOrder order = resolveByteOrder(inherited);
    Context context(parent);

    for (const auto& [name, descriptor] : m_fields)
    {
        const std::size_t start = source.position();
        try
        {
            Value value = descriptor->decodeField(source, context, order);
            BINFORM_LOG_TRACE("field '{}' ({}) at offset {}: {} byte(s) -> {}",
                              name, descriptor->typeName(), start,
                              source.position() - start, value.toString());
            context.insert(name, std::move(value));
        }
        catch (Error& e)
        {
            BINFORM_LOG_DEBUG("field '{}' ({}) failed at offset {}: {}",
                              name, descriptor->typeName(), start, e.message());
            e.prependField(name);
            throw;
        }
    }
    return context;
}

Value Format::decode(ByteSource& source, const Context& context, ByteOrder inherited) const
{
    return decodeFields(source, &context, inherited).toValue();
}

DecodeResult Format::parseCounted(ByteSource& source, const DecodeOptions& options) const
{
    const std::size_t start = source.position();
    Context fields = decodeFields(source, nullptr, options.defaultByteOrder);

    if (!options.allowLeftover && !source.atEnd())
    {
        throw TrailingData(source.position());
    }

    const std::size_t consumed = source.position() - start;
    BINFORM_LOG_DEBUG("decoded {} field(s) from {} byte(s)", fields.size(), consumed);
    return DecodeResult{std::move(fields), consumed};
}

DecodeResult Format::parseCounted(std::span<const std::uint8_t> data, const DecodeOptions& options) const
{
    BufferSource source(data);
    return parseCounted(source, options);
}

Context Format::parse(ByteSource& source, const DecodeOptions& options) const
{
    return parseCounted(source, options).fields;
}

Context Format::parse(std::span<const std::uint8_t> data, const DecodeOptions& options) const
{
    BufferSource source(data);
    return parse(source, options);
}

} // namespace binform
