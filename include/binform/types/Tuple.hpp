/**
 * @file Tuple.hpp
 * @brief Fixed heterogeneous sequence of descriptors.
 */

#pragma once

#include "../FieldDescriptor.hpp"
#include <memory>
#include <string>
#include <vector>

namespace binform
{
    /**
     * @class Tuple
     * @brief Decodes each element in order and returns them as a list.
     *
     * Every element sees the context the tuple was given. Tuple elements
     * are not named, so they do not see each other.
     */
    class Tuple : public FieldDescriptor
    {
    public:
        /**
         * @throws InvalidConfiguration if any element is null.
         */
        explicit Tuple(std::vector<DescriptorPtr> elements, FieldOptions options = {});

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;

        std::string typeName() const override;

        const std::vector<DescriptorPtr>& elements() const { return m_elements; }
        std::size_t size() const { return m_elements.size(); }

    private:
        std::vector<DescriptorPtr> m_elements;
    };

    inline DescriptorPtr tuple(std::vector<DescriptorPtr> elements, FieldOptions options = {})
    {
        return std::make_shared<Tuple>(std::move(elements), std::move(options));
    }

} // namespace binform
