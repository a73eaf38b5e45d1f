/**
 * @file Qid.hpp
 * @brief The 13-byte opaque file identity token.
 *
 * The codec never interprets the bytes; a Qid is copied verbatim and
 * compared only for equality. Its length is fixed by type, so a Qid of
 * any other size cannot be constructed.
 */

#pragma once

#include "Cursor.hpp"
#include <array>
#include <cstdint>

namespace ninep
{
    class Qid
    {
    public:
        static constexpr size_t kSize = 13;
        using Bytes = std::array<uint8_t, kSize>;

        /**
         * @brief Constructs an all-zero Qid.
         */
        Qid() = default;

        explicit Qid(const Bytes& bytes) : m_bytes(bytes) {}

        /**
         * @brief Builds a Qid from a runtime-sized byte range.
         * @throws MalformedInput unless bytes is exactly kSize long.
         */
        static Qid fromBytes(ReadCursor bytes);

        const Bytes& bytes() const { return m_bytes; }

        static constexpr size_t sizeOf() { return kSize; }

        /**
         * @brief Copies the first 13 bytes of the buffer into a Qid.
         * @throws MalformedInput if fewer than 13 bytes are available.
         */
        static Decoded<Qid> read(ReadCursor buffer);

        /**
         * @brief Copies the Qid to the front of the buffer.
         * @return The buffer shifted by 13.
         * @throws MalformedInput if fewer than 13 bytes are available.
         */
        static WriteCursor write(const Qid& qid, WriteCursor buffer);

        bool operator==(const Qid& other) const = default;

    private:
        Bytes m_bytes{};
    };

} // namespace ninep
