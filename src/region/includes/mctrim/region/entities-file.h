#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mctrim/region/record-payload.h"
#include "mctrim/region/slot-container.h"

namespace mctrim::region {

/**
 * A companion container (entities/ or poi/) sharing the region layout.
 *
 * Records stay compressed and opaque, and only populated indices are kept,
 * so serialization depends on the zero gap fill of the tables. Records are
 * normally dropped by index to follow chunks trimmed from the region file
 * with the same name.
 */
class EntitiesFile : public SlotContainer<RecordPayload>
{
public:
    EntitiesFile(const uint8_t* data, std::size_t size);

    explicit EntitiesFile(const std::vector<uint8_t>& data);

    static EntitiesFile
    from_file(const std::string& path);

    /**
     * Remove the records at the given indices
     *
     * @return Number of records actually removed
     */
    std::size_t
    remove_slots(const std::vector<uint16_t>& indices);
};

}  // namespace mctrim::region
