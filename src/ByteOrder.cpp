/**
 * @file ByteOrder.cpp
 * @brief Conversions between ByteOrder values and their names.
 */

#include "binform/ByteOrder.hpp"
#include "binform/Errors.hpp"

namespace binform
{

ByteOrder parseByteOrder(std::string_view name)
{
    if (name == "little") return ByteOrder::Little;
    if (name == "big") return ByteOrder::Big;
    if (name == "native") return ByteOrder::Native;
    if (name == "inherit") return ByteOrder::Inherit;

    throw InvalidConfiguration("unknown byte order '" + std::string(name) + "'");
}

std::string toString(ByteOrder order)
{
    switch (order)
    {
        case ByteOrder::Inherit: return "inherit";
        case ByteOrder::Little:  return "little";
        case ByteOrder::Big:     return "big";
        case ByteOrder::Native:  return "native";
    }
    return "unknown";
}

} // namespace binform
