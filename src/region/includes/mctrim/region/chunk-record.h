#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "mctrim/region/record-payload.h"

namespace mctrim::region {

/**
 * A chunk record of a region file: the compressed payload plus its inflated
 * field stream (root frame already stripped) for the fast field scan.
 *
 * Accessors never build a tree; each one is a single byte search (see
 * locate_field), so they are cheap enough to call from trim predicates.
 */
class ChunkRecord
{
public:
    ChunkRecord() = default;

    /**
     * Decode and inflate a chunk from its sector run
     *
     * @throws ContainerError subclasses on malformed header, unsupported
     * compression, truncated slice or corrupt zlib stream
     */
    static ChunkRecord
    decode(const uint8_t* data, std::size_t size);

    std::vector<uint8_t>
    encode() const
    {
        return payload_.encode();
    }

    bool
    empty() const
    {
        return payload_.empty();
    }

    void
    clear()
    {
        payload_.clear();
        fields_.clear();
        fields_.shrink_to_fit();
    }

    // Ticks players have spent near the chunk (long InhabitedTime)
    uint64_t
    inhabited_time() const;

    int32_t
    x_pos() const;

    int32_t
    y_pos() const;

    int32_t
    z_pos() const;

    const RecordPayload&
    payload() const
    {
        return payload_;
    }

    const std::vector<uint8_t>&
    fields() const
    {
        return fields_;
    }

private:
    RecordPayload payload_;
    std::vector<uint8_t> fields_;
};

// Returns true when the chunk should be trimmed
using ChunkPredicate = std::function<bool(const ChunkRecord&)>;

}  // namespace mctrim::region
