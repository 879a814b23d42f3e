#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <string>
#include <vector>

#include "mctrim/region/fixed-array.h"
#include "mctrim/region/region-errors.h"
#include "mctrim/region/region-types.h"

namespace mctrim::region {

template <typename P>
concept CompactablePayload = requires(const P& payload)
{
    {
        payload.encode()
    }
    ->std::same_as<std::vector<uint8_t>>;
};

/**
 * Serialize slots into a complete region file image.
 *
 * Payloads are packed back to back from sector 2 in the order of their
 * current offsets (stable, so slots sharing an offset keep their relative
 * order); slots whose payload encodes to nothing get a zero location and a
 * zero timestamp. The location/timestamp tables are then emitted in index
 * order with exactly SLOT_COUNT entries each; indices with no slot are
 * zero filled, which is what sparse containers rely on.
 *
 * A container previously written by this function comes out byte identical
 * when no payload changed.
 *
 * The slots are updated in place to their new locations and are left
 * sorted by index.
 *
 * @throws ContainerError if a payload is not sector aligned or the layout
 * does not fit the 24-bit offset / 8-bit size fields
 * @throws InvalidHeaderError if a slot index is out of range
 */
template <CompactablePayload Payload>
std::vector<uint8_t>
compact(std::vector<Slot<Payload>>& slots)
{
    std::stable_sort(
        slots.begin(), slots.end(), [](const auto& a, const auto& b) {
            return a.location.offset < b.location.offset;
        });

    uint32_t cursor = FIRST_PAYLOAD_SECTOR;
    std::vector<uint8_t> payloads;

    for (auto& slot : slots)
    {
        std::vector<uint8_t> encoded = slot.payload.encode();
        if (encoded.empty())
        {
            slot.location = SlotLocation{};
            slot.timestamp = Timestamp{};
            continue;
        }

        if (encoded.size() % SECTOR_SIZE != 0)
        {
            throw ContainerError(
                "Slot " + std::to_string(slot.index) + " encodes to " +
                std::to_string(encoded.size()) +
                " bytes, not a whole number of sectors");
        }

        const std::size_t sectors = encoded.size() / SECTOR_SIZE;
        if (sectors > MAX_SECTOR_COUNT)
        {
            throw ContainerError(
                "Slot " + std::to_string(slot.index) + " needs " +
                std::to_string(sectors) + " sectors, more than a location "
                                          "entry can describe");
        }
        if (cursor > MAX_SECTOR_OFFSET)
        {
            throw ContainerError(
                "Sector offset " + std::to_string(cursor) +
                " does not fit in 24 bits");
        }

        slot.location.offset = cursor;
        slot.location.size = static_cast<uint8_t>(sectors);
        cursor += static_cast<uint32_t>(sectors);
        payloads.insert(payloads.end(), encoded.begin(), encoded.end());
    }

    std::stable_sort(
        slots.begin(), slots.end(), [](const auto& a, const auto& b) {
            return a.index < b.index;
        });

    LocationTable locations;
    TimestampTable timestamps;
    for (const auto& slot : slots)
    {
        if (slot.index >= SLOT_COUNT)
        {
            throw InvalidHeaderError(
                "Slot index " + std::to_string(slot.index) + " out of range");
        }
        locations[slot.index] = slot.location;
        timestamps[slot.index] = slot.timestamp;
    }

    std::vector<uint8_t> bytes(HEADER_SIZE + payloads.size());
    locations.encode(bytes.data());
    timestamps.encode(bytes.data() + LOCATION_TABLE_SIZE);
    std::copy(payloads.begin(), payloads.end(), bytes.begin() + HEADER_SIZE);
    return bytes;
}

}  // namespace mctrim::region
