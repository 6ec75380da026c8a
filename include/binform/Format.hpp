/**
 * @file Format.hpp
 * @brief Ordered, named aggregate of descriptors.
 *
 * A Format is the unit users decode: it runs its fields in declaration
 * order against one shared ByteSource, recording each result in a
 * Context that later fields can reference by name. Since a Format is
 * itself a FieldDescriptor, formats nest.
 */

#pragma once

#include "FieldDescriptor.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace binform
{
    /**
     * @struct DecodeOptions
     * @brief Settings for a top-level decode.
     */
    struct DecodeOptions
    {
        /// Accept input that is longer than the format.
        bool allowLeftover = false;

        /// Order used by fields that neither set nor inherit one.
        ByteOrder defaultByteOrder = ByteOrder::Native;
    };

    /**
     * @struct DecodeResult
     * @brief Decoded fields plus the number of bytes they took.
     */
    struct DecodeResult
    {
        Context fields;
        std::size_t bytesConsumed = 0;
    };

    /**
     * @class Format
     * @brief Named fields decoded in declaration order.
     */
    class Format : public FieldDescriptor
    {
    public:
        using FieldList = std::vector<std::pair<std::string, DescriptorPtr>>;

        /**
         * @class Builder
         * @brief Collects fields in order, then builds an immutable Format.
         */
        class Builder
        {
        public:
            explicit Builder(FieldOptions options = {}) : m_options(std::move(options)) {}

            Builder& field(std::string name, DescriptorPtr descriptor)
            {
                m_fields.emplace_back(std::move(name), std::move(descriptor));
                return *this;
            }

            std::shared_ptr<const Format> build() const
            {
                return std::make_shared<const Format>(m_fields, m_options);
            }

        private:
            FieldList m_fields;
            FieldOptions m_options;
        };

        /**
         * @throws InvalidConfiguration for an empty or duplicate name, or a
         * null descriptor.
         */
        explicit Format(FieldList fields, FieldOptions options = {});

        // --- Top-level decoding ---

        /**
         * @brief Decodes all fields from @p source.
         * @throws TrailingData if bytes are left and options.allowLeftover is false.
         */
        Context parse(ByteSource& source, const DecodeOptions& options = {}) const;
        Context parse(std::span<const std::uint8_t> data, const DecodeOptions& options = {}) const;

        /**
         * @brief Like parse(), also reporting the number of bytes consumed.
         */
        DecodeResult parseCounted(ByteSource& source, const DecodeOptions& options = {}) const;
        DecodeResult parseCounted(std::span<const std::uint8_t> data, const DecodeOptions& options = {}) const;

        // --- Nested decoding ---

        /**
         * @brief Decodes this format as one field of a containing format.
         *
         * Leftover bytes are never checked here. Lookups fall back to
         * @p context, the containing format's fields.
         * @return A record value holding this format's fields.
         */
        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;

        /**
         * @brief Runs the fields into a new Context chained to @p parent.
         */
        Context decodeFields(ByteSource& source, const Context* parent, ByteOrder inherited) const;

        std::string typeName() const override { return "format"; }

        const FieldList& fields() const { return m_fields; }
        std::size_t size() const { return m_fields.size(); }

    private:
        FieldList m_fields;
    };

    using FormatPtr = std::shared_ptr<const Format>;

    inline FormatPtr format(Format::FieldList fields, FieldOptions options = {})
    {
        return std::make_shared<const Format>(std::move(fields), std::move(options));
    }

} // namespace binform
