/**
 * @file Cursor.hpp
 * @brief Non-owning buffer views used to thread a read or write
 * through consecutive fields.
 *
 * A cursor is a std::span: shifting it narrows the view and never copies
 * the underlying storage. Every read returns a Decoded<T> holding the
 * value and the unconsumed rest of the source; every write returns the
 * unconsumed rest of the destination.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ninep
{
    using ReadCursor = std::span<const uint8_t>;
    using WriteCursor = std::span<uint8_t>;

    /**
     * @struct Decoded
     * @brief The success value of a read.
     */
    template <typename T>
    struct Decoded
    {
        T value;
        ReadCursor rest;
    };

    /**
     * @brief Advances a cursor by n bytes.
     * Callers check bounds first; n must not exceed cursor.size().
     */
    template <typename Byte>
    inline std::span<Byte> shift(std::span<Byte> cursor, size_t n)
    {
        return cursor.subspan(n);
    }

} // namespace ninep
