#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "mctrim/core/logger.h"
#include "mctrim/region/compaction.h"
#include "mctrim/region/container-io.h"
#include "mctrim/region/fixed-array.h"
#include "mctrim/region/region-errors.h"
#include "mctrim/region/region-types.h"

namespace mctrim::region {

template <typename P>
concept ContainerPayload = CompactablePayload<P> &&
    std::default_initializable<P> &&
    requires(
        P payload, const P& cpayload, const uint8_t* data, std::size_t size)
{
    {
        P::decode(data, size)
    }
    ->std::same_as<P>;
    {
        cpayload.empty()
    }
    ->std::convertible_to<bool>;
    payload.clear();
};

enum class SlotRetention {
    DENSE,  // one slot per index, populated or not
    SPARSE  // only indices holding a record
};

/**
 * In-memory form of one container file: its slots and a dirty flag.
 *
 * Built from the whole file image (tables at 0..8192, payload offsets are
 * absolute). The only mutations are trim() and remove_slot(); both only
 * ever clear records, so a cleared slot stays cleared. to_bytes() runs the
 * compaction engine over the slots.
 */
template <ContainerPayload Payload>
class SlotContainer
{
public:
    using slot_type = Slot<Payload>;

    /**
     * @param data Whole container file
     * @param size Size of the file in bytes
     * @param retention Whether unpopulated indices keep a slot
     * @throws InvalidHeaderError if the tables are missing or a populated
     * slot points into the tables
     * @throws ContainerError subclasses from decoding any payload
     */
    SlotContainer(
        const uint8_t* data,
        std::size_t size,
        SlotRetention retention)
        : retention_(retention)
    {
        if (size < HEADER_SIZE)
        {
            throw InvalidHeaderError(
                "Container of " + std::to_string(size) +
                " bytes is too small for its location and timestamp tables");
        }

        const auto locations = LocationTable::decode(data, LOCATION_TABLE_SIZE);
        const auto timestamps = TimestampTable::decode(
            data + LOCATION_TABLE_SIZE, TIMESTAMP_TABLE_SIZE);

        slots_.reserve(retention_ == SlotRetention::DENSE ? SLOT_COUNT : 64);
        for (std::size_t i = 0; i < SLOT_COUNT; ++i)
        {
            const SlotLocation& location = locations[i];
            slot_type slot;
            slot.index = static_cast<uint16_t>(i);
            slot.location = location;
            slot.timestamp = timestamps[i];

            if (location.size > 0)
            {
                if (location.offset < FIRST_PAYLOAD_SECTOR)
                {
                    throw InvalidHeaderError(
                        "Slot " + std::to_string(i) + " points at sector " +
                        std::to_string(location.offset) +
                        " inside the header");
                }

                const std::size_t start =
                    static_cast<std::size_t>(location.offset) * SECTOR_SIZE;
                if (start >= size)
                {
                    throw TruncatedPayloadError(
                        "Slot " + std::to_string(i) + " starts at byte " +
                        std::to_string(start) + " past the end of the file");
                }

                // The final run may be unpadded; the record header decides
                const std::size_t length = std::min(
                    static_cast<std::size_t>(location.size) * SECTOR_SIZE,
                    size - start);
                slot.payload = Payload::decode(data + start, length);
            }
            else if (retention_ == SlotRetention::SPARSE)
            {
                continue;
            }

            slots_.push_back(std::move(slot));
        }
    }

    /**
     * Clear every record the predicate selects
     *
     * @param predicate Called once per non-empty record
     * @return Number of records cleared by this call
     */
    template <typename Predicate>
    requires std::predicate<Predicate&, const Payload&>
    std::size_t
    trim(Predicate&& predicate)
    {
        std::size_t cleared = 0;
        for (auto& slot : slots_)
        {
            if (slot.payload.empty())
                continue;

            const Payload& view = slot.payload;
            if (predicate(view))
            {
                slot.payload.clear();
                cleared_indices_.push_back(slot.index);
                ++cleared;
            }
        }

        if (cleared > 0)
        {
            dirty_ = true;
            LOGD("Trimmed ", cleared, " records");
        }
        return cleared;
    }

    /**
     * Drop the record at index regardless of its contents
     *
     * @return true if a record was present and has been removed
     */
    bool
    remove_slot(uint16_t index)
    {
        auto it = std::find_if(
            slots_.begin(), slots_.end(), [index](const slot_type& slot) {
                return slot.index == index;
            });
        if (it == slots_.end() || it->payload.empty())
            return false;

        if (retention_ == SlotRetention::SPARSE)
        {
            slots_.erase(it);
        }
        else
        {
            it->payload.clear();
        }

        cleared_indices_.push_back(index);
        dirty_ = true;
        return true;
    }

    bool
    dirty() const
    {
        return dirty_;
    }

    // Indices cleared by trim() or remove_slot(), in clearing order
    const std::vector<uint16_t>&
    cleared_indices() const
    {
        return cleared_indices_;
    }

    std::size_t
    populated_count() const
    {
        return std::count_if(
            slots_.begin(), slots_.end(), [](const slot_type& slot) {
                return !slot.payload.empty();
            });
    }

    const std::vector<slot_type>&
    slots() const
    {
        return slots_;
    }

    SlotRetention
    retention() const
    {
        return retention_;
    }

    // Compact into a file image; slot locations are updated to match
    std::vector<uint8_t>
    to_bytes()
    {
        return compact(slots_);
    }

    SaveOutcome
    save_to_file(const std::string& path)
    {
        return write_container_file(path, to_bytes());
    }

private:
    SlotRetention retention_;
    std::vector<slot_type> slots_;
    std::vector<uint16_t> cleared_indices_;
    bool dirty_ = false;
};

}  // namespace mctrim::region
