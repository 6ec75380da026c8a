/**
 * @file TextEncoding.hpp
 * @brief Text encodings understood by the String descriptor.
 */

#pragma once

#include <optional>
#include <string_view>

namespace binform
{
    enum class TextEncoding
    {
        Utf8,
        Ascii,
        Latin1,
        Utf16Le,
        Utf16Be
    };

    /**
     * @brief Looks up an encoding by name.
     *
     * Matching ignores case, '-' and '_', so "UTF-8", "utf8" and "utf_8"
     * are the same encoding. "iso-8859-1" is accepted for latin-1.
     */
    std::optional<TextEncoding> parseEncoding(std::string_view name);

    std::string_view encodingName(TextEncoding encoding);

} // namespace binform
