/**
 * @file Errors.hpp
 * @brief Exception hierarchy raised while building schemas or decoding.
 *
 * Every failure is reported by throwing one of the classes below. The
 * field path is filled in as the exception travels out through the
 * enclosing Formats, so that the top-level caller can tell which field
 * the malformed input belongs to.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace binform
{
    /**
     * @class Error
     * @brief Base class of all binform exceptions.
     */
    class Error : public std::runtime_error
    {
    public:
        explicit Error(const std::string& message);

        /**
         * @brief Full message, prefixed with the field path when known.
         */
        const char* what() const noexcept override;

        /**
         * @brief Dotted path of the field that failed (e.g. "header.size").
         * Empty if the error was raised outside any Format.
         */
        const std::string& fieldPath() const noexcept { return m_path; }

        /**
         * @brief The message without the field path.
         */
        const std::string& message() const noexcept { return m_message; }

        /**
         * @brief Prepends one path component. Called by Format while the
         * exception unwinds through it.
         */
        void prependField(std::string_view name);

    private:
        void rebuild();

        std::string m_message;
        std::string m_path;
        std::string m_what;
    };

    /// The source ran out before a fixed-size read could complete.
    class InsufficientData : public Error
    {
    public:
        InsufficientData(std::size_t requested, std::size_t available, std::size_t position);

        std::size_t requested() const noexcept { return m_requested; }
        std::size_t available() const noexcept { return m_available; }
        std::size_t position() const noexcept { return m_position; }

    private:
        std::size_t m_requested;
        std::size_t m_available;
        std::size_t m_position;
    };

    /// The schema is malformed.
    class InvalidConfiguration : public Error
    {
    public:
        using Error::Error;
    };

    /// A dependent length named a field that has not been decoded.
    class UnresolvedReference : public Error
    {
    public:
        explicit UnresolvedReference(const std::string& name);

        const std::string& reference() const noexcept { return m_reference; }

    private:
        std::string m_reference;
    };

    /// Top-level decode finished with bytes left over.
    class TrailingData : public Error
    {
    public:
        explicit TrailingData(std::size_t position);
    };

    /// Bytes could not be decoded as text in the configured encoding.
    class InvalidEncoding : public Error
    {
    public:
        InvalidEncoding(const std::string& encoding, std::size_t offset);

        const std::string& encoding() const noexcept { return m_encoding; }

    private:
        std::string m_encoding;
    };

} // namespace binform
