/**
 * @file TextCodec.hpp
 * @brief Byte-to-text decoding for the String descriptor.
 *
 * All encodings decode to UTF-8 std::string.
 */

#pragma once

#include "binform/TextEncoding.hpp"
#include "binform/Value.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace binform
{
namespace utils
{
    /**
     * @brief Appends the UTF-8 encoding of @p codepoint.
     */
    void appendUtf8(std::string& out, uint32_t codepoint);

    /**
     * @brief Decodes @p bytes as text.
     * @throws InvalidEncoding naming the offset of the first bad byte.
     */
    std::string decodeText(const ByteString& bytes, TextEncoding encoding);

} // namespace utils
} // namespace binform
