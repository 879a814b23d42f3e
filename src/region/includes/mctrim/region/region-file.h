#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mctrim/region/chunk-record.h"
#include "mctrim/region/slot-container.h"

namespace mctrim::region {

/**
 * A region (".mca") file: 1024 chunk slots, every index retained.
 *
 * Typical use:
 * ```cpp
 * auto region = RegionFile::from_file(path);
 * region.trim([](const ChunkRecord& c) { return c.inhabited_time() <= 1200; });
 * if (region.dirty())
 *     region.save_to_file(out_path);
 * ```
 */
class RegionFile : public SlotContainer<ChunkRecord>
{
public:
    RegionFile(const uint8_t* data, std::size_t size);

    explicit RegionFile(const std::vector<uint8_t>& data);

    /**
     * @throws ContainerIOError if the file cannot be read
     * @throws ContainerError subclasses if the file is malformed
     */
    static RegionFile
    from_file(const std::string& path);
};

}  // namespace mctrim::region
