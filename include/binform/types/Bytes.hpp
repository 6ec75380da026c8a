/**
 * @file Bytes.hpp
 * @brief Raw byte strings and encoded text.
 */

#pragma once

#include "../FieldDescriptor.hpp"
#include "../Termination.hpp"
#include "../TextEncoding.hpp"
#include <memory>
#include <string>

namespace binform
{
    /**
     * @class Bytes
     * @brief Array of raw bytes, read at the byte level.
     *
     * count and byteBudget both read exactly that many bytes in one call.
     * With a sentinel, windows of the sentinel's size are read and
     * appended until a window equals the sentinel. Unlike Array, the
     * sentinel bytes are kept at the end of the result.
     */
    class Bytes : public FieldDescriptor
    {
    public:
        /**
         * @throws InvalidConfiguration if the termination is invalid or
         * the sentinel is not a non-empty byte or text value.
         */
        explicit Bytes(Termination termination, FieldOptions options = {});

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;

        std::string typeName() const override { return "bytes"; }

        /**
         * @brief The same as decode(), without wrapping the result in a Value.
         */
        ByteString decodeRaw(ByteSource& source, const Context& context) const;

        const Termination& termination() const { return m_termination; }

    private:
        Termination m_termination;
        ByteString m_sentinel;
    };

    /**
     * @class String
     * @brief Bytes decoded as text in a configurable encoding.
     *
     * Supported encodings are utf-8 (default), ascii, latin-1, utf-16le
     * and utf-16be. The result is always UTF-8.
     */
    class String : public FieldDescriptor
    {
    public:
        /**
         * @throws InvalidConfiguration for an unknown encoding name or an
         * invalid termination.
         */
        explicit String(Termination termination, std::string encoding = "utf-8", FieldOptions options = {});

        Value decode(ByteSource& source, const Context& context, ByteOrder inherited) const override;

        std::string typeName() const override { return "string<" + m_encoding + ">"; }

        const std::string& encoding() const { return m_encoding; }

    private:
        Bytes m_bytes;
        std::string m_encoding;
        TextEncoding m_codec;
    };

    inline DescriptorPtr bytes(Termination termination, FieldOptions options = {})
    {
        return std::make_shared<Bytes>(std::move(termination), std::move(options));
    }

    inline DescriptorPtr string(Termination termination, std::string encoding = "utf-8", FieldOptions options = {})
    {
        return std::make_shared<String>(std::move(termination), std::move(encoding), std::move(options));
    }

} // namespace binform
