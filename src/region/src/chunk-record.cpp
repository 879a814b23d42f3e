#include "mctrim/region/chunk-record.h"
#include "mctrim/region/field-scan.h"
#include "mctrim/region/region-errors.h"

#include <string>

namespace mctrim::region {

ChunkRecord
ChunkRecord::decode(const uint8_t* data, std::size_t size)
{
    ChunkRecord record;
    record.payload_ = RecordPayload::decode(data, size);

    std::vector<uint8_t> inflated = record.payload_.decompress();
    if (inflated.size() < ROOT_FRAME_SIZE)
    {
        throw DecompressionError(
            "Inflated chunk of " + std::to_string(inflated.size()) +
            " bytes has no root frame");
    }

    record.fields_.assign(inflated.begin() + ROOT_FRAME_SIZE, inflated.end());
    return record;
}

uint64_t
ChunkRecord::inhabited_time() const
{
    return scan_field<ttLONG>(fields_, "InhabitedTime");
}

int32_t
ChunkRecord::x_pos() const
{
    return scan_field<ttINT>(fields_, "xPos");
}

int32_t
ChunkRecord::y_pos() const
{
    return scan_field<ttINT>(fields_, "yPos");
}

int32_t
ChunkRecord::z_pos() const
{
    return scan_field<ttINT>(fields_, "zPos");
}

}  // namespace mctrim::region
