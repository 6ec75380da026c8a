/**
 * @file Float.hpp
 * @brief IEEE754 half, single and double precision decoders.
 */

#pragma once

#include "../FieldDescriptor.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace binform
{
    /**
     * @class Float
     * @brief Decodes 2, 4 or 8 bytes as IEEE754; the value is widened to double.
     */
    class Float : public FieldDescriptor
    {
    public:
        /**
         * @throws InvalidConfiguration unless @p width is 2, 4 or 8.
         */
        explicit Float(std::size_t width, FieldOptions options = {});

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;

        std::string typeName() const override { return "f" + std::to_string(m_width * 8); }

        std::size_t width() const { return m_width; }

    private:
        std::size_t m_width;
    };

    inline DescriptorPtr f16(FieldOptions options = {}) { return std::make_shared<Float>(2, std::move(options)); }
    inline DescriptorPtr f32(FieldOptions options = {}) { return std::make_shared<Float>(4, std::move(options)); }
    inline DescriptorPtr f64(FieldOptions options = {}) { return std::make_shared<Float>(8, std::move(options)); }

} // namespace binform
