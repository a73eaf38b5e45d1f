/**
 * @file StatReader.hpp
 * @brief Walks a buffer of back-to-back Stat records.
 *
 * A 9P directory read returns its entries as concatenated Stat records.
 * Unlike Stat::read, the reader enforces each record's leading size
 * field: a record must decode to exactly the declared number of bytes.
 */

#pragma once

#include "Cursor.hpp"
#include "Stat.hpp"
#include <vector>

namespace ninep
{
    class StatReader
    {
    public:
        explicit StatReader(ReadCursor buffer) : m_rest(buffer) {}

        bool hasNext() const { return !m_rest.empty(); }

        /// Bytes not yet consumed.
        size_t remaining() const { return m_rest.size(); }

        /**
         * @brief Decodes the next record.
         * @throws MalformedInput if the record is truncated or its fields
         * do not fill exactly the declared size. The reader does not
         * advance on failure.
         */
        Stat next();

        /**
         * @brief Decodes every record in the buffer.
         * @throws MalformedInput on the first bad record.
         */
        static std::vector<Stat> readAll(ReadCursor buffer);

        /// Sum of sizeOf() over all records.
        static size_t sizeOfAll(const std::vector<Stat>& stats);

        /**
         * @brief Encodes the records back to back.
         * @return The buffer shifted past the last record.
         */
        static WriteCursor writeAll(const std::vector<Stat>& stats, WriteCursor buffer);

    private:
        ReadCursor m_rest;
    };

} // namespace ninep
