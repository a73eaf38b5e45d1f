/**
 * @file Stat.hpp
 * @brief The 9P file-status record.
 *
 * Wire layout, in this exact order with no optional fields:
 *
 *   size[2] type[2] dev[4] qid[13] mode[4] atime[4] mtime[4] length[8]
 *   name[s] uid[s] gid[s] muid[s]
 *
 * where [s] is a Data string and size counts every byte after itself.
 */

#pragma once

#include "Cursor.hpp"
#include "Qid.hpp"
#include <cstdint>
#include <string>

namespace ninep
{
    /**
     * @struct Stat
     * @brief File metadata. Built by the caller just before writing, or
     * produced by read(); the codec keeps no state of its own.
     */
    struct Stat
    {
        /// Size of type through length: 2 + 4 + 13 + 4 + 4 + 4 + 8.
        static constexpr size_t kFixedSize = 39;

        uint16_t    type = 0;   ///< Kernel device type
        uint32_t    dev = 0;    ///< Kernel device number
        Qid         qid;        ///< Unique file identity
        uint32_t    mode = 0;   ///< Permissions and flags
        uint32_t    atime = 0;  ///< Last access time
        uint32_t    mtime = 0;  ///< Last modification time
        uint64_t    length = 0; ///< File length in bytes
        std::string name;       ///< Last path element
        std::string uid;        ///< Owner name
        std::string gid;        ///< Group name
        std::string muid;       ///< Name of the last modifying user

        /**
         * @brief Total wire size, including the leading size field.
         * An all-empty Stat is 49 bytes.
         */
        size_t sizeOf() const;

        /**
         * @brief Decodes a record from the front of the buffer.
         *
         * The leading size field is consumed but not checked against the
         * bytes that follow; see StatReader for a checked walk. Strings are
         * copied out of the buffer.
         *
         * @return The record and the buffer shifted past its last string.
         * @throws MalformedInput if any field is truncated. No partial
         * record is returned.
         */
        static Decoded<Stat> read(ReadCursor buffer);

        /**
         * @brief Encodes a record at the front of the buffer.
         *
         * On failure a prefix of the buffer may already be written; the
         * caller must discard its contents.
         *
         * @return The buffer shifted by sizeOf().
         * @throws MalformedInput if the buffer is too small, a string is
         * longer than Data::kMaxLength, or the record does not fit the
         * 16-bit size field.
         */
        static WriteCursor write(const Stat& stat, WriteCursor buffer);

        bool operator==(const Stat& other) const = default;
    };

} // namespace ninep
