/**
 * @file Value.cpp
 * @brief Implementation of Value and WideInt.
 */

#include "binform/Value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace binform
{
namespace
{
    /**
     * @brief Sign and trimmed little-endian magnitude of an integer value.
     * Used to compare integers independently of how they are stored.
     */
    struct IntegerKey
    {
        bool negative = false;
        ByteString magnitude;

        bool operator==(const IntegerKey&) const = default;
    };

    ByteString trimmed(ByteString bytes)
    {
        while (!bytes.empty() && bytes.back() == 0) bytes.pop_back();
        return bytes;
    }

    ByteString toLeBytes(std::uint64_t v)
    {
        ByteString out(8);
        for (std::size_t i = 0; i < 8; ++i)
        {
            out[i] = static_cast<std::uint8_t>(v >> (8 * i));
        }
        return trimmed(std::move(out));
    }

    std::optional<IntegerKey> integerKey(const Value::Storage& storage)
    {
        if (const auto* v = std::get_if<std::int64_t>(&storage))
        {
            // Two's complement negation also covers INT64_MIN.
            std::uint64_t m = *v < 0 ? ~static_cast<std::uint64_t>(*v) + 1
                                     : static_cast<std::uint64_t>(*v);
            return IntegerKey{*v < 0, toLeBytes(m)};
        }
        if (const auto* v = std::get_if<std::uint64_t>(&storage))
        {
            return IntegerKey{false, toLeBytes(*v)};
        }
        if (const auto* v = std::get_if<WideInt>(&storage))
        {
            return IntegerKey{v->isNegative(), v->magnitude()};
        }
        return std::nullopt;
    }

    /**
     * @brief Like integerKey(), also mapping bools to 0/1 and integral
     * doubles to their integer value.
     */
    std::optional<IntegerKey> numericKey(const Value::Storage& storage)
    {
        if (const auto* b = std::get_if<bool>(&storage))
        {
            return IntegerKey{false, toLeBytes(*b ? 1 : 0)};
        }
        if (const auto* d = std::get_if<double>(&storage))
        {
            // 2^64: every integral double below this fits a uint64 magnitude.
            constexpr double kLimit = 18446744073709551616.0;
            const double m = std::fabs(*d);
            if (!std::isfinite(*d) || std::trunc(*d) != *d || m >= kLimit) return std::nullopt;
            return IntegerKey{*d < 0, toLeBytes(static_cast<std::uint64_t>(m))};
        }
        return integerKey(storage);
    }

    bool isNumeric(const Value::Storage& storage)
    {
        return std::holds_alternative<bool>(storage) ||
               std::holds_alternative<double>(storage) ||
               integerKey(storage).has_value();
    }

    std::optional<std::uint64_t> magnitudeAsU64(const ByteString& magnitude)
    {
        if (magnitude.size() > 8) return std::nullopt;

        std::uint64_t m = 0;
        for (std::size_t i = 0; i < magnitude.size(); ++i)
        {
            m |= static_cast<std::uint64_t>(magnitude[i]) << (8 * i);
        }
        return m;
    }

    void render(const Value& value, std::string& out);

    void renderBytes(const ByteString& bytes, std::string& out)
    {
        out += "b\"";
        for (std::uint8_t b : bytes)
        {
            out += fmt::format("\\x{:02X}", b);
        }
        out += '"';
    }

    void render(const Value& value, std::string& out)
    {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                out += "none";
            else if constexpr (std::is_same_v<T, bool>)
                out += v ? "true" : "false";
            else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>)
                out += fmt::format("{}", v);
            else if constexpr (std::is_same_v<T, WideInt>)
                out += v.toString();
            else if constexpr (std::is_same_v<T, double>)
                out += fmt::format("{}", v);
            else if constexpr (std::is_same_v<T, ByteString>)
                renderBytes(v, out);
            else if constexpr (std::is_same_v<T, std::string>)
                out += fmt::format("\"{}\"", v);
            else if constexpr (std::is_same_v<T, Value::List>)
            {
                out += '[';
                for (std::size_t i = 0; i < v.size(); ++i)
                {
                    if (i > 0) out += ", ";
                    render(v[i], out);
                }
                out += ']';
            }
            else
            {
                out += '{';
                for (std::size_t i = 0; i < v.size(); ++i)
                {
                    if (i > 0) out += ", ";
                    out += v[i].name;
                    out += ": ";
                    render(v[i].value, out);
                }
                out += '}';
            }
        }, value.storage());
    }

} // namespace

// --- WideInt ---

WideInt::WideInt(ByteString littleEndianBytes, bool isSigned)
    : m_bytes(std::move(littleEndianBytes)), m_signed(isSigned)
{
}

bool WideInt::isNegative() const
{
    return m_signed && !m_bytes.empty() && (m_bytes.back() & 0x80) != 0;
}

ByteString WideInt::magnitude() const
{
    ByteString out = m_bytes;
    if (isNegative())
    {
        // Negate: invert every byte, then add one.
        unsigned carry = 1;
        for (auto& b : out)
        {
            unsigned sum = static_cast<std::uint8_t>(~b) + carry;
            b = static_cast<std::uint8_t>(sum);
            carry = sum >> 8;
        }
    }
    return trimmed(std::move(out));
}

std::string WideInt::toString() const
{
    ByteString mag = magnitude();
    if (mag.empty()) return "0";

    std::string digits;
    while (!mag.empty())
    {
        // Long division of the magnitude by 10, most significant byte first.
        unsigned remainder = 0;
        for (std::size_t i = mag.size(); i-- > 0;)
        {
            unsigned cur = (remainder << 8) | mag[i];
            mag[i] = static_cast<std::uint8_t>(cur / 10);
            remainder = cur % 10;
        }
        digits.push_back(static_cast<char>('0' + remainder));
        mag = trimmed(std::move(mag));
    }

    if (isNegative()) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// --- Value ---

Value::Value() = default;
Value::Value(bool value) : m_storage(value) {}
Value::Value(WideInt value) : m_storage(std::move(value)) {}
Value::Value(ByteString value) : m_storage(std::move(value)) {}
Value::Value(std::string value) : m_storage(std::move(value)) {}
Value::Value(const char* value) : m_storage(std::string(value)) {}
Value::Value(List value) : m_storage(std::move(value)) {}
Value::Value(Record value) : m_storage(std::move(value)) {}

Value::Value(const Value& other) = default;
Value::Value(Value&& other) noexcept = default;
Value& Value::operator=(const Value& other) = default;
Value& Value::operator=(Value&& other) noexcept = default;
Value::~Value() = default;

bool Value::isInteger() const
{
    return std::holds_alternative<std::int64_t>(m_storage) ||
           std::holds_alternative<std::uint64_t>(m_storage) ||
           std::holds_alternative<WideInt>(m_storage);
}

std::optional<std::int64_t> Value::toInt64() const
{
    auto key = integerKey(m_storage);
    if (!key) return std::nullopt;

    auto m = magnitudeAsU64(key->magnitude);
    if (!m) return std::nullopt;

    constexpr auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (!key->negative)
    {
        if (*m > limit) return std::nullopt;
        return static_cast<std::int64_t>(*m);
    }
    if (*m > limit + 1) return std::nullopt;
    return static_cast<std::int64_t>(~*m + 1);
}

std::optional<std::uint64_t> Value::toUInt64() const
{
    auto key = integerKey(m_storage);
    if (!key || key->negative) return std::nullopt;
    return magnitudeAsU64(key->magnitude);
}

const Value* Value::find(std::string_view name) const
{
    const auto* record = std::get_if<Record>(&m_storage);
    if (!record) return nullptr;

    auto it = std::find_if(record->begin(), record->end(),
        [&](const Field& f) { return f.name == name; });
    return it != record->end() ? &it->value : nullptr;
}

const Value& Value::operator[](std::string_view name) const
{
    const Value* v = find(name);
    if (!v)
    {
        throw std::out_of_range("no field named '" + std::string(name) + "' in " + toString());
    }
    return *v;
}

const Value& Value::operator[](std::size_t index) const
{
    const List& list = asList();
    if (index >= list.size())
    {
        throw std::out_of_range(
            "index " + std::to_string(index) +
            " is out of bounds for list of size " + std::to_string(list.size())
        );
    }
    return list[index];
}

std::string Value::toString() const
{
    std::string out;
    render(*this, out);
    return out;
}

bool operator==(const Value& lhs, const Value& rhs)
{
    // Numbers compare by value across bool, integer and float kinds.
    const bool lnum = isNumeric(lhs.m_storage);
    const bool rnum = isNumeric(rhs.m_storage);
    if (lnum || rnum)
    {
        if (!lnum || !rnum) return false;
        if (lhs.isFloat() && rhs.isFloat()) return lhs.asDouble() == rhs.asDouble();

        auto lkey = numericKey(lhs.m_storage);
        auto rkey = numericKey(rhs.m_storage);
        return lkey && rkey && *lkey == *rkey;
    }
    return lhs.m_storage == rhs.m_storage;
}

} // namespace binform
