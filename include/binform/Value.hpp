/**
 * @file Value.hpp
 * @brief The dynamically-typed result of decoding a field.
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace binform
{
    using ByteString = std::vector<std::uint8_t>;

    /**
     * @class WideInt
     * @brief An integer decoded from more than 8 bytes.
     *
     * The value is kept as little-endian two's complement bytes (signed)
     * or as a little-endian magnitude (unsigned).
     */
    class WideInt
    {
    public:
        WideInt() = default;
        WideInt(ByteString littleEndianBytes, bool isSigned);

        const ByteString& bytes() const { return m_bytes; }
        std::size_t width() const { return m_bytes.size(); }
        bool isSigned() const { return m_signed; }
        bool isNegative() const;

        /// Decimal rendering, e.g. "-340282366920938463463374607431768211455".
        std::string toString() const;

        /// Little-endian magnitude with no trailing zero bytes.
        ByteString magnitude() const;

        friend bool operator==(const WideInt& lhs, const WideInt& rhs) = default;

    private:
        ByteString m_bytes;
        bool m_signed = false;
    };

    class Value;
    struct Field;

    /**
     * @class Value
     * @brief Holds one decoded value of any kind.
     *
     * Integers up to 8 bytes are stored as int64/uint64 depending on the
     * signedness of the decoder; wider integers as WideInt. Equality
     * compares numbers by mathematical value regardless of storage, so
     * Value(0) == Value(0.0) == Value(false).
     */
    class Value
    {
    public:
        using List = std::vector<Value>;
        using Record = std::vector<Field>;
        using Storage = std::variant<
            std::monostate, bool, std::int64_t, std::uint64_t, WideInt,
            double, ByteString, std::string, List, Record
        >;

        Value();
        Value(bool value);
        Value(WideInt value);
        Value(ByteString value);
        Value(std::string value);
        Value(const char* value);
        Value(List value);
        Value(Record value);

        template <std::integral T>
            requires (!std::same_as<T, bool>)
        Value(T value)
        {
            if constexpr (std::is_signed_v<T>)
                m_storage = static_cast<std::int64_t>(value);
            else
                m_storage = static_cast<std::uint64_t>(value);
        }

        template <std::floating_point T>
        Value(T value) : m_storage(static_cast<double>(value)) {}

        Value(const Value& other);
        Value(Value&& other) noexcept;
        Value& operator=(const Value& other);
        Value& operator=(Value&& other) noexcept;
        ~Value();

        // --- Kind queries ---
        bool isNone() const { return std::holds_alternative<std::monostate>(m_storage); }
        bool isBool() const { return std::holds_alternative<bool>(m_storage); }
        bool isInteger() const;
        bool isFloat() const { return std::holds_alternative<double>(m_storage); }
        bool isBytes() const { return std::holds_alternative<ByteString>(m_storage); }
        bool isText() const { return std::holds_alternative<std::string>(m_storage); }
        bool isList() const { return std::holds_alternative<List>(m_storage); }
        bool isRecord() const { return std::holds_alternative<Record>(m_storage); }

        // --- Typed access (throws std::bad_variant_access on mismatch) ---
        bool asBool() const { return std::get<bool>(m_storage); }
        double asDouble() const { return std::get<double>(m_storage); }
        const WideInt& asWideInt() const { return std::get<WideInt>(m_storage); }
        const ByteString& asBytes() const { return std::get<ByteString>(m_storage); }
        const std::string& asText() const { return std::get<std::string>(m_storage); }
        const List& asList() const { return std::get<List>(m_storage); }
        const Record& asRecord() const { return std::get<Record>(m_storage); }

        /**
         * @brief The integer value if it is representable as int64.
         */
        std::optional<std::int64_t> toInt64() const;

        /**
         * @brief The integer value if it is non-negative and fits in uint64.
         */
        std::optional<std::uint64_t> toUInt64() const;

        /**
         * @brief Looks up a field of a record value.
         * @return nullptr if this is not a record or the name is absent.
         */
        const Value* find(std::string_view name) const;

        /**
         * @brief Record field access.
         * @throws std::out_of_range if the field does not exist.
         */
        const Value& operator[](std::string_view name) const;

        /**
         * @brief List element access.
         * @throws std::out_of_range if the index is past the end.
         */
        const Value& operator[](std::size_t index) const;

        const Storage& storage() const { return m_storage; }

        /// Human-readable rendering, used in log lines and test failures.
        std::string toString() const;

        friend bool operator==(const Value& lhs, const Value& rhs);

    private:
        Storage m_storage;
    };

    /**
     * @struct Field
     * @brief One named entry of a record value.
     */
    struct Field
    {
        std::string name;
        Value value;

        friend bool operator==(const Field& lhs, const Field& rhs) = default;
    };

} // namespace binform
