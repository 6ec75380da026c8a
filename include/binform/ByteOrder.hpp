/**
 * @file ByteOrder.hpp
 * @brief Byte order preferences and their resolution rules.
 */

#pragma once

#include <bit>
#include <string>
#include <string_view>

namespace binform
{
    /**
     * @enum ByteOrder
     * @brief Byte order preference attached to a descriptor.
     *
     * Inherit means "use whatever the containing descriptor resolved to".
     * Native is an explicit request for the host order.
     */
    enum class ByteOrder
    {
        Inherit,
        Little,
        Big,
        Native
    };

    /**
     * @brief The host platform's byte order, as Little or Big.
     */
    constexpr ByteOrder nativeByteOrder()
    {
        return std::endian::native == std::endian::big ? ByteOrder::Big : ByteOrder::Little;
    }

    /**
     * @brief Applies the precedence explicit > inherited > native.
     * @param preferred The descriptor's own preference.
     * @param inherited The order handed down by the container.
     * @return Either ByteOrder::Little or ByteOrder::Big.
     */
    constexpr ByteOrder resolveByteOrder(ByteOrder preferred, ByteOrder inherited)
    {
        if (preferred == ByteOrder::Little || preferred == ByteOrder::Big) return preferred;
        if (preferred == ByteOrder::Native) return nativeByteOrder();
        if (inherited == ByteOrder::Little || inherited == ByteOrder::Big) return inherited;
        return nativeByteOrder();
    }

    /**
     * @brief Parses "little", "big", "native" or "inherit".
     * @throws InvalidConfiguration for any other name.
     */
    ByteOrder parseByteOrder(std::string_view name);

    std::string toString(ByteOrder order);

} // namespace binform
