/**
 * @file Tuple.cpp
 * @brief Implementation of the Tuple decoder.
 */

#include "binform/types/Tuple.hpp"
#include "binform/Errors.hpp"

#include <algorithm>

namespace binform
{
    Tuple::Tuple(std::vector<DescriptorPtr> elements, FieldOptions options)
        : FieldDescriptor(std::move(options)), m_elements(std::move(elements))
    {
        auto it = std::find(m_elements.begin(), m_elements.end(), nullptr);
        if (it != m_elements.end())
        {
            throw InvalidConfiguration(
                "tuple element " + std::to_string(it - m_elements.begin()) + " is null"
            );
        }
    }

    Value Tuple::decode(ByteSource& source, const Context& context, ByteOrder inherited) const
    {
        const ByteOrder order = resolveByteOrder(inherited);

        Value::List result;
        result.reserve(m_elements.size());
        for (const auto& element : m_elements)
        {
            result.push_back(element->decodeField(source, context, order));
        }
        return Value(std::move(result));
    }

    std::string Tuple::typeName() const
    {
        std::string name = "tuple<";
        for (std::size_t i = 0; i < m_elements.size(); ++i)
        {
            if (i > 0) name += ", ";
            name += m_elements[i]->typeName();
        }
        return name + ">";
    }

} // namespace binform
