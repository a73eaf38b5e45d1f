/**
 * @file StatReader.cpp
 * @brief Implementation of StatReader.
 */

#include "ninep/StatReader.hpp"
#include "ninep/Error.hpp"
#include "ninep/Int.hpp"
#include <string>

namespace ninep
{
    Stat StatReader::next()
    {
        uint16_t declared = Int16::read(m_rest).value;
        size_t total = 2 + static_cast<size_t>(declared);
        requireSpace("StatReader", "next", m_rest.size(), total);

        // Decode from a window of exactly the declared size so a short
        // record cannot borrow bytes from the one after it.
        auto decoded = Stat::read(m_rest.first(total));
        if (!decoded.rest.empty())
        {
            throw MalformedInput(
                "StatReader.next: record size mismatch (" +
                std::to_string(total - decoded.rest.size() - 2) + " != " +
                std::to_string(declared) + ")"
            );
        }

        m_rest = shift(m_rest, total);
        return std::move(decoded.value);
    }

    std::vector<Stat> StatReader::readAll(ReadCursor buffer)
    {
        StatReader reader(buffer);
        std::vector<Stat> stats;
        while (reader.hasNext())
        {
            stats.push_back(reader.next());
        }
        return stats;
    }

    size_t StatReader::sizeOfAll(const std::vector<Stat>& stats)
    {
        size_t total = 0;
        for (const auto& stat : stats)
        {
            total += stat.sizeOf();
        }
        return total;
    }

    WriteCursor StatReader::writeAll(const std::vector<Stat>& stats, WriteCursor buffer)
    {
        WriteCursor rest = buffer;
        for (const auto& stat : stats)
        {
            rest = Stat::write(stat, rest);
        }
        return rest;
    }

} // namespace ninep
