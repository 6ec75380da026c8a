/**
 * @file Array.hpp
 * @brief Homogeneous sequence of elements.
 */

#pragma once

#include "../FieldDescriptor.hpp"
#include "../Termination.hpp"
#include <memory>
#include <string>

namespace binform
{
    /**
     * @class Array
     * @brief Decodes elements of one descriptor until the termination
     * strategy is met.
     *
     * - count: exactly that many elements.
     * - byteBudget: elements until exactly that many bytes are consumed;
     *   an element that crosses the budget is an error, not truncated.
     * - sentinel: elements until one equals the sentinel value. The
     *   sentinel is consumed but not part of the result (Bytes keeps it).
     *
     * Elements inherit the array's resolved byte order and see the same
     * context as the array.
     */
    class Array : public FieldDescriptor
    {
    public:
        /**
         * @throws InvalidConfiguration if @p element is null or the
         * termination does not name exactly one strategy.
         */
        Array(DescriptorPtr element, Termination termination, FieldOptions options = {});

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;

        std::string typeName() const override { return "array<" + m_element->typeName() + ">"; }

        const DescriptorPtr& element() const { return m_element; }
        const Termination& termination() const { return m_termination; }

    private:
        Value::List decodeCount(ByteSource& source, const Context& context, ByteOrder order) const;
        Value::List decodeBudget(ByteSource& source, const Context& context, ByteOrder order) const;
        Value::List decodeUntilSentinel(ByteSource& source, const Context& context, ByteOrder order) const;

        DescriptorPtr m_element;
        Termination m_termination;
    };

    inline DescriptorPtr array(DescriptorPtr element, Termination termination, FieldOptions options = {})
    {
        return std::make_shared<Array>(std::move(element), std::move(termination), std::move(options));
    }

} // namespace binform
