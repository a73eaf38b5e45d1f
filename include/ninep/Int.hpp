/**
 * @file Int.hpp
 * @brief Fixed-width unsigned little-endian integer codecs.
 *
 * Int8, Int16, Int32 and Int64 are instantiations of one template. All
 * four are unsigned on the wire and in memory.
 */

#pragma once

#include "Cursor.hpp"
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace ninep
{
    template <typename T> inline constexpr std::string_view int_name = "UNKNOWN";

    template<> inline constexpr std::string_view int_name<uint8_t>  = "Int8";
    template<> inline constexpr std::string_view int_name<uint16_t> = "Int16";
    template<> inline constexpr std::string_view int_name<uint32_t> = "Int32";
    template<> inline constexpr std::string_view int_name<uint64_t> = "Int64";

    /**
     * @class FixedInt
     * @brief Codec for a single unsigned integer of width sizeof(T).
     *
     * Defined in Int.cpp and explicitly instantiated for the four
     * widths above.
     */
    template <typename T>
    class FixedInt
    {
        static_assert(std::is_unsigned_v<T>, "T must be an unsigned integer");

    public:
        using ValueType = T;

        static constexpr size_t sizeOf() { return sizeof(T); }

        /**
         * @brief Decodes a value from the front of the buffer.
         * @return The value and the buffer shifted by sizeOf().
         * @throws MalformedInput if the buffer is shorter than sizeOf().
         */
        static Decoded<T> read(ReadCursor buffer);

        /**
         * @brief Encodes a value at the front of the buffer, in place.
         * @return The buffer shifted by sizeOf().
         * @throws MalformedInput if the buffer is shorter than sizeOf().
         */
        static WriteCursor write(T value, WriteCursor buffer);
    };

    using Int8  = FixedInt<uint8_t>;
    using Int16 = FixedInt<uint16_t>;
    using Int32 = FixedInt<uint32_t>;
    using Int64 = FixedInt<uint64_t>;

    extern template class FixedInt<uint8_t>;
    extern template class FixedInt<uint16_t>;
    extern template class FixedInt<uint32_t>;
    extern template class FixedInt<uint64_t>;

} // namespace ninep
