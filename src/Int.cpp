/**
 * @file Int.cpp
 * @brief Implementation of the fixed-width integer codecs.
 */

#include "ninep/Int.hpp"
#include "ninep/Error.hpp"
#include "utils/BinaryIO.hpp"

namespace ninep
{
    template <typename T>
    Decoded<T> FixedInt<T>::read(ReadCursor buffer)
    {
        requireSpace(int_name<T>, "read", buffer.size(), sizeOf());
        return { utils::readLe<T>(buffer.data()), shift(buffer, sizeOf()) };
    }

    template <typename T>
    WriteCursor FixedInt<T>::write(T value, WriteCursor buffer)
    {
        requireSpace(int_name<T>, "write", buffer.size(), sizeOf());
        utils::writeLe<T>(buffer.data(), value);
        return shift(buffer, sizeOf());
    }

    template class FixedInt<uint8_t>;
    template class FixedInt<uint16_t>;
    template class FixedInt<uint32_t>;
    template class FixedInt<uint64_t>;

} // namespace ninep
