/**
 * @file ByteSource.hpp
 * @brief Sequential, position-tracked access to raw bytes.
 *
 * Every decoder pulls its bytes through this interface; it is the only
 * code that touches the underlying buffer or stream. A read either
 * delivers all requested bytes or throws InsufficientData without
 * consuming anything.
 */

#pragma once

#include "Value.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string_view>

namespace binform
{
    /**
     * @class ByteSource
     * @brief Abstract reader interface shared by buffers and streams.
     */
    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        /**
         * @brief Reads exactly @p n bytes.
         * @throws InsufficientData if fewer than @p n bytes remain; the
         * position is left unchanged in that case.
         */
        ByteString readExact(std::size_t n);

        /**
         * @brief Fills @p buffer with exactly @p n bytes.
         * Same contract as readExact().
         */
        virtual void readFully(std::uint8_t* buffer, std::size_t n) = 0;

        /**
         * @brief Discards @p n bytes, with the same atomicity as readExact().
         */
        virtual void skip(std::size_t n) = 0;

        /**
         * @brief Offset of the next byte, counted from the start of the source.
         */
        virtual std::size_t position() const = 0;

        /**
         * @brief True iff no further byte is available.
         */
        virtual bool atEnd() const = 0;

        /**
         * @brief Bytes left, if the source knows its length.
         */
        virtual std::optional<std::size_t> remaining() const = 0;

    protected:
        /**
         * @brief Checks that @p n bytes can be read without consuming them.
         * @throws InsufficientData otherwise.
         */
        virtual void checkAvailable(std::size_t n) = 0;
    };

    /**
     * @class BufferSource
     * @brief ByteSource over contiguous memory.
     *
     * Constructed from a span the buffer is only viewed, so the caller
     * keeps it alive for the duration of the decode. Constructed from a
     * ByteString or string_view the bytes are copied in.
     */
    class BufferSource : public ByteSource
    {
    public:
        explicit BufferSource(std::span<const std::uint8_t> data);
        explicit BufferSource(ByteString data);
        explicit BufferSource(std::string_view data);

        BufferSource(const BufferSource& other);
        BufferSource& operator=(const BufferSource& other);

        void readFully(std::uint8_t* buffer, std::size_t n) override;
        void skip(std::size_t n) override;
        std::size_t position() const override { return m_pos; }
        bool atEnd() const override { return m_pos >= m_view.size(); }
        std::optional<std::size_t> remaining() const override { return m_view.size() - m_pos; }

        std::size_t size() const { return m_view.size(); }

    protected:
        void checkAvailable(std::size_t n) override { checkBounds(n); }

    private:
        /**
         * @brief Checks that @p n bytes are available at the current position.
         * @throws InsufficientData otherwise.
         */
        void checkBounds(std::size_t n) const;

        ByteString m_owned;
        std::span<const std::uint8_t> m_view;
        bool m_owning = false;
        std::size_t m_pos = 0;
    };

    /**
     * @class StreamSource
     * @brief ByteSource over a std::istream.
     *
     * Bytes fetched by a read that could not be completed are kept in a
     * look-ahead buffer, so a failed read does not consume them. The
     * stream is borrowed; opening and closing it is the caller's job.
     */
    class StreamSource : public ByteSource
    {
    public:
        explicit StreamSource(std::istream& stream);

        void readFully(std::uint8_t* buffer, std::size_t n) override;
        void skip(std::size_t n) override;
        std::size_t position() const override { return m_pos; }
        bool atEnd() const override;
        std::optional<std::size_t> remaining() const override { return std::nullopt; }

    protected:
        void checkAvailable(std::size_t n) override { fill(n); }

    private:
        /**
         * @brief Pulls from the stream until @p n bytes are buffered or EOF.
         *
         * The look-ahead buffer grows chunk by chunk, so a bogus length
         * costs at most the bytes the stream actually holds.
         * @throws InsufficientData if the stream ends first.
         */
        void fill(std::size_t n);

        std::istream& m_stream;
        ByteString m_pending;
        std::size_t m_pos = 0;
    };

    /**
     * @brief Types that provide an ADL-visible `toBytes(const T&)`.
     */
    template <typename T>
    concept ByteConvertible = requires(const T& value) {
        { toBytes(value) } -> std::convertible_to<ByteString>;
    };

    inline BufferSource makeSource(std::span<const std::uint8_t> data)
    {
        return BufferSource(data);
    }

    inline StreamSource makeSource(std::istream& stream)
    {
        return StreamSource(stream);
    }

    template <ByteConvertible T>
    BufferSource makeSource(const T& value)
    {
        return BufferSource(ByteString(toBytes(value)));
    }

} // namespace binform
