/**
 * @file Array.cpp
 * @brief Implementation of the Array decoder.
 */

#include "binform/types/Array.hpp"
#include "binform/Errors.hpp"
#include "utils/Logging.hpp"

#include <algorithm>

namespace binform
{
namespace
{
    // Upper bound on up-front allocation; counts come from untrusted input.
    constexpr std::size_t kMaxReserve = 4096;
}

    Array::Array(DescriptorPtr element, Termination termination, FieldOptions options)
        : FieldDescriptor(std::move(options)),
          m_element(std::move(element)),
          m_termination(std::move(termination))
    {
        if (!m_element)
        {
            throw InvalidConfiguration("array element descriptor is null");
        }
        m_termination.validate("array");
    }

    Value Array::decode(ByteSource& source, const Context& context, ByteOrder inherited) const
    {
        const ByteOrder order = resolveByteOrder(inherited);

        if (m_termination.count) return Value(decodeCount(source, context, order));
        if (m_termination.byteBudget) return Value(decodeBudget(source, context, order));
        return Value(decodeUntilSentinel(source, context, order));
    }

    Value::List Array::decodeCount(ByteSource& source, const Context& context, ByteOrder order) const
    {
        const std::size_t n = m_termination.count->resolve(context);
        BINFORM_LOG_TRACE("{}: decoding {} element(s) at offset {}", typeName(), n, source.position());

        Value::List result;
        result.reserve(std::min(n, kMaxReserve));
        for (std::size_t i = 0; i < n; ++i)
        {
            result.push_back(m_element->decodeField(source, context, order));
        }
        return result;
    }

    Value::List Array::decodeBudget(ByteSource& source, const Context& context, ByteOrder order) const
    {
        const std::size_t budget = m_termination.byteBudget->resolve(context);
        const std::size_t start = source.position();
        BINFORM_LOG_TRACE("{}: decoding {} byte(s) at offset {}", typeName(), budget, start);

        Value::List result;
        std::size_t consumed = 0;
        while (consumed < budget)
        {
            const std::size_t before = source.position();
            result.push_back(m_element->decodeField(source, context, order));

            if (source.position() == before)
            {
                throw InvalidConfiguration(
                    typeName() + ": element consumed no bytes, byte budget can never be reached"
                );
            }

            consumed = source.position() - start;
            if (consumed > budget)
            {
                throw InvalidConfiguration(
                    typeName() + ": element " + std::to_string(result.size() - 1) +
                    " overshot the byte budget of " + std::to_string(budget) +
                    " (consumed " + std::to_string(consumed) + ")"
                );
            }
        }

        BINFORM_LOG_DEBUG("{}: byte budget {} filled by {} element(s)", typeName(), budget, result.size());
        return result;
    }

    Value::List Array::decodeUntilSentinel(ByteSource& source, const Context& context, ByteOrder order) const
    {
        const Value& sentinel = *m_termination.sentinel;

        Value::List result;
        while (true)
        {
            const std::size_t before = source.position();
            Value element = m_element->decodeField(source, context, order);

            if (element == sentinel)
            {
                BINFORM_LOG_DEBUG("{}: sentinel {} found at offset {} after {} element(s)",
                                  typeName(), sentinel.toString(), before, result.size());
                break;
            }

            if (source.position() == before)
            {
                throw InvalidConfiguration(
                    typeName() + ": element consumed no bytes, sentinel can never be reached"
                );
            }
            result.push_back(std::move(element));
        }
        return result;
    }

} // namespace binform
