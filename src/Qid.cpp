/**
 * @file Qid.cpp
 * @brief Implementation of the Qid codec.
 */

#include "ninep/Qid.hpp"
#include "ninep/Error.hpp"
#include <algorithm>
#include <string>

namespace ninep
{
    Qid Qid::fromBytes(ReadCursor bytes)
    {
        if (bytes.size() != kSize)
        {
            throw MalformedInput(
                "Qid.fromBytes: expected " + std::to_string(kSize) +
                " bytes, got " + std::to_string(bytes.size())
            );
        }
        Bytes raw;
        std::copy(bytes.begin(), bytes.end(), raw.begin());
        return Qid(raw);
    }

    Decoded<Qid> Qid::read(ReadCursor buffer)
    {
        requireSpace("Qid", "read", buffer.size(), kSize);
        return { fromBytes(buffer.first(kSize)), shift(buffer, kSize) };
    }

    WriteCursor Qid::write(const Qid& qid, WriteCursor buffer)
    {
        requireSpace("Qid", "write", buffer.size(), kSize);
        std::copy(qid.m_bytes.begin(), qid.m_bytes.end(), buffer.begin());
        return shift(buffer, kSize);
    }

} // namespace ninep
