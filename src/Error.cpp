/**
 * @file Error.cpp
 * @brief Shared bounds check for the codecs.
 */

#include "ninep/Error.hpp"

namespace ninep
{
    void requireSpace(std::string_view codec, std::string_view operation,
                      size_t available, size_t needed)
    {
        if (available < needed)
        {
            throw MalformedInput(
                std::string(codec) + "." + std::string(operation) +
                ": buffer too small (" +
                std::to_string(available) + " < " +
                std::to_string(needed) + ")"
            );
        }
    }

} // namespace ninep
