/**
 * @file Integer.hpp
 * @brief Integer decoders of any byte width, plus Bool and Char.
 */

#pragma once

#include "../FieldDescriptor.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace binform
{
    /**
     * @class Integer
     * @brief Two's complement or unsigned integer of @c width bytes.
     *
     * Widths up to 8 decode to int64/uint64 values; wider ones to WideInt.
     */
    class Integer : public FieldDescriptor
    {
    public:
        /**
         * @throws InvalidConfiguration if @p width is zero.
         */
        Integer(std::size_t width, bool isSigned, FieldOptions options = {});

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;

        std::string typeName() const override;

        std::size_t width() const { return m_width; }
        bool isSigned() const { return m_signed; }

    private:
        std::size_t m_width;
        bool m_signed;
    };

    /**
     * @class Bool
     * @brief One unsigned byte, non-zero decodes to true.
     */
    class Bool : public Integer
    {
    public:
        explicit Bool(FieldOptions options = {}) : Integer(1, false, std::move(options)) {}

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;
        std::string typeName() const override { return "bool"; }
    };

    /**
     * @class Char
     * @brief One unsigned byte decoded as a one-character text value.
     */
    class Char : public Integer
    {
    public:
        explicit Char(FieldOptions options = {}) : Integer(1, false, std::move(options)) {}

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;
        std::string typeName() const override { return "char"; }
    };

    // --- Factories ---

    inline DescriptorPtr integer(std::size_t width, bool isSigned, FieldOptions options = {})
    {
        return std::make_shared<Integer>(width, isSigned, std::move(options));
    }

    inline DescriptorPtr u8(FieldOptions options = {})  { return integer(1, false, std::move(options)); }
    inline DescriptorPtr i8(FieldOptions options = {})  { return integer(1, true, std::move(options)); }
    inline DescriptorPtr u16(FieldOptions options = {}) { return integer(2, false, std::move(options)); }
    inline DescriptorPtr i16(FieldOptions options = {}) { return integer(2, true, std::move(options)); }
    inline DescriptorPtr u32(FieldOptions options = {}) { return integer(4, false, std::move(options)); }
    inline DescriptorPtr i32(FieldOptions options = {}) { return integer(4, true, std::move(options)); }
    inline DescriptorPtr u64(FieldOptions options = {}) { return integer(8, false, std::move(options)); }
    inline DescriptorPtr i64(FieldOptions options = {}) { return integer(8, true, std::move(options)); }

    inline DescriptorPtr boolean(FieldOptions options = {})
    {
        return std::make_shared<Bool>(std::move(options));
    }

    inline DescriptorPtr character(FieldOptions options = {})
    {
        return std::make_shared<Char>(std::move(options));
    }

} // namespace binform
