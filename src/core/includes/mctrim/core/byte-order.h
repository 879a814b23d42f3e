#pragma once

#include <cstdint>

namespace mctrim::core {

/**
 * Big-endian helpers for the on-disk formats. All region data (tables,
 * record headers and the tagged field stream) is big-endian regardless of
 * the host.
 */

inline void
put_uint16_be(uint8_t* buffer, uint16_t value)
{
    buffer[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[1] = static_cast<uint8_t>(value & 0xFF);
}

/**
 * Write the low 24 bits of value (3 bytes)
 * @param buffer Output buffer (must have at least 3 bytes available)
 * @param value Value to write, bits above 24 are ignored
 */
inline void
put_uint24_be(uint8_t* buffer, uint32_t value)
{
    buffer[0] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[2] = static_cast<uint8_t>(value & 0xFF);
}

inline void
put_uint32_be(uint8_t* buffer, uint32_t value)
{
    buffer[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[3] = static_cast<uint8_t>(value & 0xFF);
}

inline void
put_uint64_be(uint8_t* buffer, uint64_t value)
{
    put_uint32_be(buffer, static_cast<uint32_t>(value >> 32));
    put_uint32_be(buffer + 4, static_cast<uint32_t>(value & 0xFFFFFFFF));
}

inline uint16_t
get_uint16_be(const uint8_t* buffer)
{
    return static_cast<uint16_t>(
        (static_cast<uint16_t>(buffer[0]) << 8) |
        static_cast<uint16_t>(buffer[1]));
}

inline uint32_t
get_uint24_be(const uint8_t* buffer)
{
    return (static_cast<uint32_t>(buffer[0]) << 16) |
        (static_cast<uint32_t>(buffer[1]) << 8) |
        static_cast<uint32_t>(buffer[2]);
}

inline uint32_t
get_uint32_be(const uint8_t* buffer)
{
    return (static_cast<uint32_t>(buffer[0]) << 24) |
        (static_cast<uint32_t>(buffer[1]) << 16) |
        (static_cast<uint32_t>(buffer[2]) << 8) |
        static_cast<uint32_t>(buffer[3]);
}

inline uint64_t
get_uint64_be(const uint8_t* buffer)
{
    return (static_cast<uint64_t>(get_uint32_be(buffer)) << 32) |
        static_cast<uint64_t>(get_uint32_be(buffer + 4));
}

}  // namespace mctrim::core
