/**
 * @file TextCodec.cpp
 * @brief Implementation of the text decoders.
 */

#include "utils/TextCodec.hpp"
#include "binform/Errors.hpp"

#include <cctype>

namespace binform
{
namespace utils
{
namespace
{
    std::string normalizedName(std::string_view name)
    {
        std::string out;
        out.reserve(name.size());
        for (unsigned char c : name)
        {
            if (c == '-' || c == '_') continue;
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        return out;
    }

    std::string decodeUtf8(const ByteString& bytes)
    {
        const std::size_t n = bytes.size();
        std::size_t i = 0;
        while (i < n)
        {
            const uint8_t b0 = bytes[i];
            std::size_t len;
            uint32_t cp;
            uint32_t minimum;

            if (b0 < 0x80)      { len = 1; cp = b0;        minimum = 0; }
            else if ((b0 & 0xe0) == 0xc0) { len = 2; cp = b0 & 0x1f; minimum = 0x80; }
            else if ((b0 & 0xf0) == 0xe0) { len = 3; cp = b0 & 0x0f; minimum = 0x800; }
            else if ((b0 & 0xf8) == 0xf0) { len = 4; cp = b0 & 0x07; minimum = 0x10000; }
            else throw InvalidEncoding("utf-8", i);

            if (i + len > n) throw InvalidEncoding("utf-8", i);

            for (std::size_t k = 1; k < len; ++k)
            {
                const uint8_t b = bytes[i + k];
                if ((b & 0xc0) != 0x80) throw InvalidEncoding("utf-8", i + k);
                cp = (cp << 6) | (b & 0x3f);
            }

            // Overlong forms, surrogates and out-of-range code points.
            if (cp < minimum || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff))
            {
                throw InvalidEncoding("utf-8", i);
            }
            i += len;
        }
        return std::string(bytes.begin(), bytes.end());
    }

    std::string decodeAscii(const ByteString& bytes)
    {
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            if (bytes[i] >= 0x80) throw InvalidEncoding("ascii", i);
        }
        return std::string(bytes.begin(), bytes.end());
    }

    std::string decodeLatin1(const ByteString& bytes)
    {
        std::string out;
        out.reserve(bytes.size());
        for (uint8_t b : bytes)
        {
            appendUtf8(out, b);
        }
        return out;
    }

    std::string decodeUtf16(const ByteString& bytes, bool bigEndian)
    {
        const std::string_view name = bigEndian ? "utf-16be" : "utf-16le";
        if (bytes.size() % 2 != 0)
        {
            throw InvalidEncoding(std::string(name), bytes.size() - 1);
        }

        auto unit = [&](std::size_t i) -> uint32_t {
            return bigEndian ? (uint32_t{bytes[i]} << 8) | bytes[i + 1]
                             : (uint32_t{bytes[i + 1]} << 8) | bytes[i];
        };

        std::string out;
        out.reserve(bytes.size());
        std::size_t i = 0;
        while (i < bytes.size())
        {
            uint32_t u = unit(i);
            if (u >= 0xd800 && u <= 0xdbff)
            {
                if (i + 4 > bytes.size()) throw InvalidEncoding(std::string(name), i);
                uint32_t lo = unit(i + 2);
                if (lo < 0xdc00 || lo > 0xdfff) throw InvalidEncoding(std::string(name), i + 2);
                appendUtf8(out, 0x10000 + ((u - 0xd800) << 10) + (lo - 0xdc00));
                i += 4;
            }
            else if (u >= 0xdc00 && u <= 0xdfff)
            {
                throw InvalidEncoding(std::string(name), i);
            }
            else
            {
                appendUtf8(out, u);
                i += 2;
            }
        }
        return out;
    }

} // namespace

void appendUtf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
    else
    {
        out.push_back(static_cast<char>(0xf0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
}

std::string decodeText(const ByteString& bytes, TextEncoding encoding)
{
    switch (encoding)
    {
        case TextEncoding::Utf8:    return decodeUtf8(bytes);
        case TextEncoding::Ascii:   return decodeAscii(bytes);
        case TextEncoding::Latin1:  return decodeLatin1(bytes);
        case TextEncoding::Utf16Le: return decodeUtf16(bytes, false);
        case TextEncoding::Utf16Be: return decodeUtf16(bytes, true);
    }
    return std::string(bytes.begin(), bytes.end());
}

} // namespace utils

std::optional<TextEncoding> parseEncoding(std::string_view name)
{
    const std::string n = utils::normalizedName(name);
    if (n == "utf8") return TextEncoding::Utf8;
    if (n == "ascii" || n == "usascii") return TextEncoding::Ascii;
    if (n == "latin1" || n == "iso88591") return TextEncoding::Latin1;
    if (n == "utf16le") return TextEncoding::Utf16Le;
    if (n == "utf16be") return TextEncoding::Utf16Be;
    return std::nullopt;
}

std::string_view encodingName(TextEncoding encoding)
{
    switch (encoding)
    {
        case TextEncoding::Utf8:    return "utf-8";
        case TextEncoding::Ascii:   return "ascii";
        case TextEncoding::Latin1:  return "latin-1";
        case TextEncoding::Utf16Le: return "utf-16le";
        case TextEncoding::Utf16Be: return "utf-16be";
    }
    return "unknown";
}

} // namespace binform
