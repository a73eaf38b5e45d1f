/**
 * @file Data.cpp
 * @brief Implementation of the Data codec.
 */

#include "ninep/Data.hpp"
#include "ninep/Error.hpp"
#include "utils/BinaryIO.hpp"
#include <algorithm>

namespace ninep
{
    namespace
    {
        void checkLength(const char* operation, size_t length)
        {
            if (length > Data::kMaxLength)
            {
                throw MalformedInput(
                    std::string(operation) + ": payload too long (" +
                    std::to_string(length) + " > " +
                    std::to_string(Data::kMaxLength) + ")"
                );
            }
        }
    }

    Data::Data(DataView bytes)
    {
        checkLength("Data", bytes.size());
        m_bytes.assign(bytes.begin(), bytes.end());
    }

    Data Data::fromString(std::string_view s)
    {
        checkLength("Data.fromString", s.size());
        Data data;
        data.m_bytes.resize(s.size());
        std::copy(s.begin(), s.end(), data.m_bytes.begin());
        return data;
    }

    std::string Data::toString(DataView view)
    {
        return std::string(view.begin(), view.end());
    }

    Decoded<DataView> Data::read(ReadCursor buffer)
    {
        if (buffer.size() < 2)
        {
            throw MalformedInput(
                "Data.read: buffer too short to contain a length field (" +
                std::to_string(buffer.size()) + " < 2)"
            );
        }
        uint16_t required = utils::readLe16(buffer.data());
        ReadCursor rest = shift(buffer, 2);
        if (rest.size() < required)
        {
            throw MalformedInput(
                "Data.read: buffer too short to contain payload (" +
                std::to_string(rest.size()) + " < " +
                std::to_string(required) + ")"
            );
        }
        return { rest.first(required), shift(rest, required) };
    }

    WriteCursor Data::write(DataView payload, WriteCursor buffer)
    {
        checkLength("Data.write", payload.size());

        // The destination must hold at least `needed` bytes.
        size_t needed = sizeOf(payload);
        requireSpace("Data", "write", buffer.size(), needed);

        utils::writeLe16(buffer.data(), static_cast<uint16_t>(payload.size()));
        std::copy(payload.begin(), payload.end(), buffer.begin() + 2);
        return shift(buffer, needed);
    }

} // namespace ninep
