/**
 * @file BinaryIO.hpp
 * @brief Central utility functions for binary conversion.
 *
 * This file is the single source of truth for turning raw bytes into
 * numbers: width-generic integer assembly in either byte order, sign
 * extension, and IEEE754 half/single/double reinterpretation.
 */

#pragma once

#include "binform/ByteOrder.hpp"
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring> // For std::memcpy

namespace binform
{
namespace utils
{
    /**
     * @brief Assembles up to 8 bytes into an unsigned integer.
     * @param b A pointer to at least @p width bytes of data.
     * @param width Number of bytes, 1..8.
     * @param order ByteOrder::Little or ByteOrder::Big.
     */
    inline uint64_t readUnsigned(const uint8_t* b, size_t width, ByteOrder order)
    {
        uint64_t v = 0;
        for (size_t i = 0; i < width; ++i)
        {
            size_t idx = (order == ByteOrder::Big) ? i : width - 1 - i;
            v = (v << 8) | static_cast<uint64_t>(b[idx]);
        }
        return v;
    }

    /**
     * @brief Sign-extends the low @p width bytes of @p v.
     */
    inline int64_t signExtend(uint64_t v, size_t width)
    {
        if (width >= 8) return static_cast<int64_t>(v);

        const unsigned bits = static_cast<unsigned>(width * 8);
        const uint64_t signBit = uint64_t{1} << (bits - 1);
        if (v & signBit)
        {
            v |= ~((uint64_t{1} << bits) - 1);
        }
        return static_cast<int64_t>(v);
    }

    /**
     * @brief Converts an IEEE754 binary16 bit pattern to float.
     *
     * Subnormals, infinities and NaN are preserved.
     */
    inline float halfToFloat(uint16_t h)
    {
        const uint32_t sign = static_cast<uint32_t>(h & 0x8000) << 16;
        const uint32_t exp  = (h >> 10) & 0x1f;
        const uint32_t mant = h & 0x3ff;

        if (exp == 0)
        {
            // Zero or subnormal: mant * 2^-24
            float magnitude = std::ldexp(static_cast<float>(mant), -24);
            return sign ? -magnitude : magnitude;
        }

        uint32_t bits;
        if (exp == 0x1f)
        {
            bits = sign | 0x7f800000u | (mant << 13);
        }
        else
        {
            bits = sign | ((exp + 127 - 15) << 23) | (mant << 13);
        }
        return std::bit_cast<float>(bits);
    }

    /**
     * @brief Reinterprets 2, 4 or 8 bytes as an IEEE754 value.
     * @param b A pointer to at least @p width bytes of data.
     * @param width 2, 4 or 8. Any other width returns 0.0.
     */
    inline double readIeee(const uint8_t* b, size_t width, ByteOrder order)
    {
        switch (width)
        {
            case 2:
                return halfToFloat(static_cast<uint16_t>(readUnsigned(b, 2, order)));
            case 4:
                return std::bit_cast<float>(static_cast<uint32_t>(readUnsigned(b, 4, order)));
            case 8:
                return std::bit_cast<double>(readUnsigned(b, 8, order));
            default:
                return 0.0;
        }
    }

} // namespace utils
} // namespace binform
