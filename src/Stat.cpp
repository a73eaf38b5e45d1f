/**
 * @file Stat.cpp
 * @brief Implementation of the Stat codec.
 */

#include "ninep/Stat.hpp"
#include "ninep/Data.hpp"
#include "ninep/Error.hpp"
#include "ninep/Int.hpp"

namespace ninep
{
    namespace
    {
        /// Reads one field and advances the cursor past it.
        template <typename Codec>
        auto take(ReadCursor& rest)
        {
            auto decoded = Codec::read(rest);
            rest = decoded.rest;
            return decoded.value;
        }

        DataView textView(const std::string& s)
        {
            return { reinterpret_cast<const uint8_t*>(s.data()), s.size() };
        }
    }

    size_t Stat::sizeOf() const
    {
        return 2 + kFixedSize
            + Data::sizeOf(textView(name))
            + Data::sizeOf(textView(uid))
            + Data::sizeOf(textView(gid))
            + Data::sizeOf(textView(muid));
    }

    Decoded<Stat> Stat::read(ReadCursor buffer)
    {
        Stat stat;
        ReadCursor rest = buffer;

        [[maybe_unused]] uint16_t size = take<Int16>(rest);

        stat.type   = take<Int16>(rest);
        stat.dev    = take<Int32>(rest);
        stat.qid    = take<Qid>(rest);
        stat.mode   = take<Int32>(rest);
        stat.atime  = take<Int32>(rest);
        stat.mtime  = take<Int32>(rest);
        stat.length = take<Int64>(rest);
        stat.name   = Data::toString(take<Data>(rest));
        stat.uid    = Data::toString(take<Data>(rest));
        stat.gid    = Data::toString(take<Data>(rest));
        stat.muid   = Data::toString(take<Data>(rest));

        return { std::move(stat), rest };
    }

    WriteCursor Stat::write(const Stat& stat, WriteCursor buffer)
    {
        size_t size = stat.sizeOf() - 2;
        if (size > 0xffff)
        {
            throw MalformedInput(
                "Stat.write: record too large (" + std::to_string(size) +
                " > 65535)"
            );
        }

        WriteCursor rest = buffer;
        rest = Int16::write(static_cast<uint16_t>(size), rest);
        rest = Int16::write(stat.type, rest);
        rest = Int32::write(stat.dev, rest);
        rest = Qid::write(stat.qid, rest);
        rest = Int32::write(stat.mode, rest);
        rest = Int32::write(stat.atime, rest);
        rest = Int32::write(stat.mtime, rest);
        rest = Int64::write(stat.length, rest);
        rest = Data::write(textView(stat.name), rest);
        rest = Data::write(textView(stat.uid), rest);
        rest = Data::write(textView(stat.gid), rest);
        rest = Data::write(textView(stat.muid), rest);
        return rest;
    }

} // namespace ninep
