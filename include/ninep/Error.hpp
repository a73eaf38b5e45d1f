/**
 * @file Error.hpp
 * @brief The single error kind reported by every 9P codec.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ninep
{
    /**
     * @class MalformedInput
     * @brief Thrown when a buffer is too short to read a field from, or
     * too small to write one into.
     *
     * The message always starts with the failing operation, e.g.
     * "Qid.read: buffer too small (3 < 13)".
     */
    class MalformedInput : public std::runtime_error
    {
    public:
        explicit MalformedInput(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Checks that a cursor has room for a field.
     * @param codec The codec name, e.g. "Int16".
     * @param operation "read" or "write".
     * @param available Bytes left in the cursor.
     * @param needed Bytes the operation touches.
     * @throws MalformedInput "<codec>.<operation>: buffer too small (available < needed)".
     */
    void requireSpace(std::string_view codec, std::string_view operation,
                      size_t available, size_t needed);

} // namespace ninep
