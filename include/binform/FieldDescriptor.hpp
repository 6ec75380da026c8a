/**
 * @file FieldDescriptor.hpp
 * @brief Abstract base class for everything that can be decoded.
 *
 * Integers, floats, arrays, tuples, byte strings and whole formats all
 * implement this interface, which is what lets them nest freely.
 */

#pragma once

#include "ByteOrder.hpp"
#include "ByteSource.hpp"
#include "Context.hpp"
#include "Value.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace binform
{
    /// Post-decode hook: receives the raw value, returns its replacement.
    using Transform = std::function<Value(Value)>;

    /**
     * @struct FieldOptions
     * @brief Settings shared by every descriptor.
     */
    struct FieldOptions
    {
        FieldOptions(ByteOrder order = ByteOrder::Inherit, Transform fn = {})
            : byteOrder(order), transform(std::move(fn)) {}

        explicit FieldOptions(Transform fn)
            : transform(std::move(fn)) {}

        ByteOrder byteOrder = ByteOrder::Inherit;
        Transform transform;
    };

    /**
     * @struct Decoded
     * @brief A decoded value together with the number of bytes it took.
     */
    struct Decoded
    {
        Value value;
        std::size_t bytesRead = 0;
    };

    /**
     * @class FieldDescriptor
     * @brief Immutable, reusable description of how to decode one value.
     *
     * Descriptors hold no decode state, so one instance may be shared by
     * any number of schemas and used from several threads at once, each
     * with its own ByteSource.
     */
    class FieldDescriptor
    {
    public:
        explicit FieldDescriptor(FieldOptions options = {})
            : m_options(std::move(options)) {}

        virtual ~FieldDescriptor() = default;

        // --- Core Deserialization Interface ---

        /**
         * @brief Extracts one value from the source.
         *
         * @param source The shared byte source, positioned at this field.
         * @param context Fields already decoded by the enclosing Format.
         * @param inherited The byte order resolved by the container.
         * @return The raw decoded value, before any transform.
         */
        virtual Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const = 0;

        /**
         * @brief decode() followed by the configured transform, if any.
         */
        Value decodeField(ByteSource& source, const Context& context,
                          ByteOrder inherited = ByteOrder::Inherit) const;

        /**
         * @brief Decodes one field and reports how many bytes it consumed.
         */
        Decoded read(ByteSource& source, const Context& context = {},
                     ByteOrder inherited = ByteOrder::Inherit) const;

        /**
         * @brief Convenience overload decoding from the start of a buffer.
         * Leftover bytes after the field are ignored.
         */
        Decoded read(std::span<const std::uint8_t> data, const Context& context = {}) const;

        /**
         * @brief Applies explicit > inherited > native.
         * @return ByteOrder::Little or ByteOrder::Big.
         */
        ByteOrder resolveByteOrder(ByteOrder inherited = ByteOrder::Inherit) const
        {
            return binform::resolveByteOrder(m_options.byteOrder, inherited);
        }

        // --- Accessors ---

        ByteOrder byteOrder() const { return m_options.byteOrder; }
        bool hasTransform() const { return static_cast<bool>(m_options.transform); }

        /// Short type name used in log lines and error messages, e.g. "u16".
        virtual std::string typeName() const = 0;

    protected:
        FieldOptions m_options;
    };

    using DescriptorPtr = std::shared_ptr<const FieldDescriptor>;

} // namespace binform
