/**
 * @file Record.hpp
 * @brief Binds a Format's result onto a user-defined struct.
 *
 * Usage:
 * @code
 *   struct Header { uint32_t magic; std::vector<uint8_t> payload; };
 *
 *   auto layout = binform::Record<Header>()
 *       .field("magic", &Header::magic, binform::u32(binform::ByteOrder::Big))
 *       .field("size", binform::u16())
 *       .field("payload", &Header::payload, binform::bytes(binform::Termination::byCount("size")));
 *
 *   Header h = layout.read(buffer);
 * @endcode
 */

#pragma once

#include "Errors.hpp"
#include "Format.hpp"
#include "Termination.hpp"
#include "types/Array.hpp"
#include <array>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace binform
{
    template <typename T> struct is_std_vector : std::false_type {};
    template <typename U> struct is_std_vector<std::vector<U>> : std::true_type {};

    template <typename T> struct is_std_array : std::false_type {};
    template <typename U, std::size_t N> struct is_std_array<std::array<U, N>> : std::true_type {};

    /**
     * @brief Converts a decoded Value to a concrete C++ type.
     *
     * Supported targets: Value, bool, integral and floating point types,
     * std::string, ByteString, std::vector<U> and std::array<U, N> of any
     * supported U.
     *
     * @throws InvalidConfiguration if the value has the wrong kind or does
     * not fit in @p T.
     */
    template <typename T>
    T valueAs(const Value& value)
    {
        auto mismatch = [&](const char* target) {
            return InvalidConfiguration(
                "cannot convert " + value.toString() + " to " + target
            );
        };

        if constexpr (std::is_same_v<T, Value>)
        {
            return value;
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            if (value.isBool()) return value.asBool();
            if (auto u = value.toUInt64()) return *u != 0;
            throw mismatch("bool");
        }
        else if constexpr (std::is_integral_v<T>)
        {
            if constexpr (std::is_signed_v<T>)
            {
                auto v = value.toInt64();
                if (!v || *v < std::numeric_limits<T>::min() || *v > std::numeric_limits<T>::max())
                    throw mismatch("signed integer member");
                return static_cast<T>(*v);
            }
            else
            {
                auto v = value.toUInt64();
                if (!v || *v > std::numeric_limits<T>::max())
                    throw mismatch("unsigned integer member");
                return static_cast<T>(*v);
            }
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            if (value.isFloat()) return static_cast<T>(value.asDouble());
            if (auto s = value.toInt64()) return static_cast<T>(*s);
            if (auto u = value.toUInt64()) return static_cast<T>(*u);
            throw mismatch("floating point member");
        }
        else if constexpr (std::is_same_v<T, std::string>)
        {
            if (value.isText()) return value.asText();
            if (value.isBytes()) return std::string(value.asBytes().begin(), value.asBytes().end());
            throw mismatch("std::string");
        }
        else if constexpr (std::is_same_v<T, ByteString>)
        {
            if (value.isBytes()) return value.asBytes();
            if (value.isList())
            {
                ByteString out;
                out.reserve(value.asList().size());
                for (const auto& element : value.asList()) out.push_back(valueAs<std::uint8_t>(element));
                return out;
            }
            throw mismatch("byte string");
        }
        else if constexpr (is_std_vector<T>::value)
        {
            if (value.isBytes())
            {
                T out;
                out.reserve(value.asBytes().size());
                for (std::uint8_t b : value.asBytes()) out.push_back(valueAs<typename T::value_type>(Value(b)));
                return out;
            }
            if (!value.isList()) throw mismatch("std::vector");

            T out;
            out.reserve(value.asList().size());
            for (const auto& element : value.asList())
            {
                out.push_back(valueAs<typename T::value_type>(element));
            }
            return out;
        }
        else if constexpr (is_std_array<T>::value)
        {
            // Byte strings convert element-wise, like lists of u8.
            const std::size_t n = value.isBytes() ? value.asBytes().size()
                                : value.isList()  ? value.asList().size()
                                                  : 0;
            if ((!value.isBytes() && !value.isList()) || n != std::tuple_size_v<T>)
                throw mismatch("std::array of matching size");

            T out{};
            for (std::size_t i = 0; i < out.size(); ++i)
            {
                out[i] = value.isBytes()
                    ? valueAs<typename T::value_type>(Value(value.asBytes()[i]))
                    : valueAs<typename T::value_type>(value.asList()[i]);
            }
            return out;
        }
        else
        {
            static_assert(sizeof(T) == 0, "valueAs: unsupported target type");
        }
    }

    /**
     * @class Record
     * @brief Declares a Format whose fields map onto members of @p T.
     *
     * Fields are decoded in the order they are declared. Fields declared
     * without a member are decoded (and visible to later length
     * references) but not stored.
     */
    template <typename T>
    class Record
    {
        static_assert(std::is_default_constructible_v<T>, "T must be default-constructible");

    public:
        using Assign = std::function<void(T&, const Value&)>;

        explicit Record(FieldOptions options = {}) : m_options(std::move(options))
        {
            rebuild();
        }

        /**
         * @brief Declares a field stored in @p member.
         */
        template <typename M>
        Record& field(std::string name, M T::*member, DescriptorPtr descriptor)
        {
            return add(std::move(name), std::move(descriptor), [member](T& record, const Value& value) {
                record.*member = valueAs<M>(value);
            });
        }

        /**
         * @brief Declares a field decoded by another Record and stored in @p member.
         */
        template <typename U>
        Record& field(std::string name, U T::*member, const Record<U>& nested)
        {
            return add(std::move(name), nested.format(), [member, nested](T& record, const Value& value) {
                record.*member = nested.fromValue(value);
            });
        }

        /**
         * @brief Declares an array of nested records stored in @p member.
         */
        template <typename U>
        Record& field(std::string name, std::vector<U> T::*member, const Record<U>& nested,
                      Termination termination)
        {
            auto descriptor = array(nested.format(), std::move(termination));
            return add(std::move(name), std::move(descriptor), [member, nested](T& record, const Value& value) {
                if (!value.isList())
                {
                    throw InvalidConfiguration("expected a list of records, got " + value.toString());
                }
                std::vector<U> out;
                out.reserve(value.asList().size());
                for (const auto& element : value.asList())
                {
                    out.push_back(nested.fromValue(element));
                }
                record.*member = std::move(out);
            });
        }

        /**
         * @brief Declares a field that is decoded but not stored.
         */
        Record& field(std::string name, DescriptorPtr descriptor)
        {
            return add(std::move(name), std::move(descriptor), nullptr);
        }

        /**
         * @brief Builds a T from decoded fields.
         * @throws InvalidConfiguration if a value does not fit its member.
         */
        T assemble(const Context& fields) const
        {
            return build([&](const std::string& name) -> const Value& { return fields.at(name); });
        }

        /**
         * @brief Builds a T from a record value, as produced by a nested Format.
         * @throws InvalidConfiguration if @p value is not a record.
         * @throws UnresolvedReference if a bound field is missing.
         */
        T fromValue(const Value& value) const
        {
            if (!value.isRecord())
            {
                throw InvalidConfiguration("expected a record, got " + value.toString());
            }
            return build([&](const std::string& name) -> const Value& {
                const Value* v = value.find(name);
                if (!v) throw UnresolvedReference(name);
                return *v;
            });
        }

        T read(ByteSource& source, const DecodeOptions& options = {}) const
        {
            return assemble(m_format->parse(source, options));
        }

        T read(std::span<const std::uint8_t> data, const DecodeOptions& options = {}) const
        {
            return assemble(m_format->parse(data, options));
        }

        /**
         * @brief The underlying Format, usable as a field of another Format.
         */
        const FormatPtr& format() const { return m_format; }

    private:
        template <typename Lookup>
        T build(Lookup&& lookup) const
        {
            T record{};
            for (const auto& [name, assign] : m_bindings)
            {
                try
                {
                    assign(record, lookup(name));
                }
                catch (Error& e)
                {
                    e.prependField(name);
                    throw;
                }
            }
            return record;
        }

        /**
         * @brief Appends a field, committing nothing unless the new
         * Format is valid.
         */
        Record& add(std::string name, DescriptorPtr descriptor, Assign assign)
        {
            Format::FieldList fields = m_fields;
            fields.emplace_back(name, std::move(descriptor));
            auto format = std::make_shared<const Format>(fields, m_options);

            if (assign) m_bindings.emplace_back(std::move(name), std::move(assign));
            m_fields = std::move(fields);
            m_format = std::move(format);
            return *this;
        }

        void rebuild()
        {
            m_format = std::make_shared<const Format>(m_fields, m_options);
        }

        Format::FieldList m_fields;
        std::vector<std::pair<std::string, Assign>> m_bindings;
        FieldOptions m_options;
        FormatPtr m_format;
    };

} // namespace binform
