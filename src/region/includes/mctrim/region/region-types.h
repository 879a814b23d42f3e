#pragma once

#include <cstddef>
#include <cstdint>

#include "mctrim/core/byte-order.h"

namespace mctrim::region {

static constexpr std::size_t SECTOR_SIZE = 4096;
static constexpr std::size_t SLOT_COUNT = 1024;
static constexpr std::size_t LOCATION_TABLE_SIZE = 4096;
static constexpr std::size_t TIMESTAMP_TABLE_SIZE = 4096;
static constexpr std::size_t HEADER_SIZE =
    LOCATION_TABLE_SIZE + TIMESTAMP_TABLE_SIZE;

// u32 length + u8 compression scheme
static constexpr std::size_t RECORD_HEADER_SIZE = 5;

// Sectors 0 and 1 hold the two tables
static constexpr uint32_t FIRST_PAYLOAD_SECTOR = 2;

static constexpr uint32_t MAX_SECTOR_OFFSET = 0xFFFFFF;
static constexpr uint32_t MAX_SECTOR_COUNT = 0xFF;

enum CompressionScheme : uint8_t { csGZIP = 1, csZLIB = 2, csNONE = 3 };

/**
 * Where a slot's payload lives, in sectors from the start of the file.
 * On disk: 3-byte big-endian offset followed by a 1-byte sector count.
 */
struct SlotLocation
{
    static constexpr std::size_t WIDTH = 4;

    uint32_t offset = 0;
    uint8_t size = 0;

    bool
    unused() const
    {
        return offset == 0 && size == 0;
    }

    void
    encode(uint8_t* out) const
    {
        core::put_uint24_be(out, offset);
        out[3] = size;
    }

    static SlotLocation
    decode(const uint8_t* in)
    {
        return SlotLocation{core::get_uint24_be(in), in[3]};
    }

    bool
    operator==(const SlotLocation&) const = default;
};

/**
 * Opaque modification marker paired with a slot, 4 bytes big-endian
 */
struct Timestamp
{
    static constexpr std::size_t WIDTH = 4;

    uint32_t value = 0;

    void
    encode(uint8_t* out) const
    {
        core::put_uint32_be(out, value);
    }

    static Timestamp
    decode(const uint8_t* in)
    {
        return Timestamp{core::get_uint32_be(in)};
    }

    bool
    operator==(const Timestamp&) const = default;
};

/**
 * One addressable record position of a container. The location, timestamp
 * and payload of an index always travel together.
 */
template <typename Payload>
struct Slot
{
    uint16_t index = 0;
    SlotLocation location;
    Timestamp timestamp;
    Payload payload;
};

}  // namespace mctrim::region
