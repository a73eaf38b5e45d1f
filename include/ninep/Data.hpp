/**
 * @file Data.hpp
 * @brief The 16-bit length-prefixed byte string.
 *
 * Wire form: a uint16 little-endian count n followed by n raw bytes.
 *
 * Data::read returns a DataView that aliases the source buffer; the
 * caller must keep the source alive and unmodified while the view is in
 * use. The owning Data class is used to build payloads for writing.
 */

#pragma once

#include "Cursor.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ninep
{
    /// A decoded payload. Non-owning.
    using DataView = std::span<const uint8_t>;

    class Data
    {
    public:
        static constexpr size_t kMaxLength = 0xffff;

        Data() = default;

        /**
         * @brief Copies a byte range into a new Data value.
         * @throws MalformedInput if bytes is longer than kMaxLength.
         */
        explicit Data(DataView bytes);

        /**
         * @brief Copies the text's bytes into a fresh buffer of exactly
         * that length.
         * @throws MalformedInput if s is longer than kMaxLength.
         */
        static Data fromString(std::string_view s);

        std::string toString() const { return toString(bytes()); }
        static std::string toString(DataView view);

        DataView bytes() const { return m_bytes; }
        size_t length() const { return m_bytes.size(); }

        size_t sizeOf() const { return sizeOf(bytes()); }
        static size_t sizeOf(DataView payload) { return 2 + payload.size(); }

        /**
         * @brief Decodes a payload from the front of the buffer.
         * @return A view of the payload and the buffer shifted by 2 + n.
         * @throws MalformedInput if the length field or payload is truncated.
         */
        static Decoded<DataView> read(ReadCursor buffer);

        /**
         * @brief Encodes a payload at the front of the buffer.
         * @return The buffer shifted by 2 + payload.size().
         * @throws MalformedInput if the payload exceeds kMaxLength or the
         * buffer has fewer than 2 + payload.size() bytes left.
         */
        static WriteCursor write(DataView payload, WriteCursor buffer);
        static WriteCursor write(const Data& data, WriteCursor buffer) { return write(data.bytes(), buffer); }

        bool operator==(const Data& other) const = default;

    private:
        std::vector<uint8_t> m_bytes;
    };

} // namespace ninep
