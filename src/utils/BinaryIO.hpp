/**
 * @file BinaryIO.hpp
 * @brief Central utility functions for binary I/O.
 *
 * This file provides a single source of truth for the low-level
 * little-endian conversion logic used by every fixed-width codec.
 * None of these functions check bounds; callers must guarantee the
 * pointer covers the full width.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace ninep
{
namespace utils
{
    /**
     * @brief Reads a 16-bit little-endian value from a byte buffer.
     * @param b A pointer to at least 2 bytes of data.
     */
    inline uint16_t readLe16(const uint8_t* b)
    {
        return static_cast<uint16_t>(
            static_cast<uint16_t>(b[0]) |
            (static_cast<uint16_t>(b[1]) << 8)
        );
    }

    /**
     * @brief Reads a 32-bit little-endian value from a byte buffer.
     * @param b A pointer to at least 4 bytes of data.
     */
    inline uint32_t readLe32(const uint8_t* b)
    {
        return static_cast<uint32_t>(b[0]) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    /**
     * @brief Reads a 64-bit little-endian value from a byte buffer.
     * @param b A pointer to at least 8 bytes of data.
     */
    inline uint64_t readLe64(const uint8_t* b)
    {
        return static_cast<uint64_t>(b[0]) |
               (static_cast<uint64_t>(b[1]) << 8) |
               (static_cast<uint64_t>(b[2]) << 16) |
               (static_cast<uint64_t>(b[3]) << 24) |
               (static_cast<uint64_t>(b[4]) << 32) |
               (static_cast<uint64_t>(b[5]) << 40) |
               (static_cast<uint64_t>(b[6]) << 48) |
               (static_cast<uint64_t>(b[7]) << 56);
    }

    inline void writeLe16(uint8_t* b, uint16_t v)
    {
        b[0] = static_cast<uint8_t>(v);
        b[1] = static_cast<uint8_t>(v >> 8);
    }

    inline void writeLe32(uint8_t* b, uint32_t v)
    {
        b[0] = static_cast<uint8_t>(v);
        b[1] = static_cast<uint8_t>(v >> 8);
        b[2] = static_cast<uint8_t>(v >> 16);
        b[3] = static_cast<uint8_t>(v >> 24);
    }

    inline void writeLe64(uint8_t* b, uint64_t v)
    {
        writeLe32(b, static_cast<uint32_t>(v));
        writeLe32(b + 4, static_cast<uint32_t>(v >> 32));
    }

    /**
     * @brief Reads an unsigned little-endian value of the width of T.
     *
     * Dispatches to the fixed-width helpers above so the integer codecs
     * can be written once as a template.
     */
    template <typename T>
    inline T readLe(const uint8_t* b)
    {
        if constexpr (sizeof(T) == 1) return b[0];
        else if constexpr (sizeof(T) == 2) return readLe16(b);
        else if constexpr (sizeof(T) == 4) return readLe32(b);
        else
        {
            static_assert(sizeof(T) == 8);
            return readLe64(b);
        }
    }

    template <typename T>
    inline void writeLe(uint8_t* b, T v)
    {
        if constexpr (sizeof(T) == 1) b[0] = v;
        else if constexpr (sizeof(T) == 2) writeLe16(b, v);
        else if constexpr (sizeof(T) == 4) writeLe32(b, v);
        else
        {
            static_assert(sizeof(T) == 8);
            writeLe64(b, v);
        }
    }

} // namespace utils
} // namespace ninep
