#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "mctrim/region/region-types.h"

namespace mctrim::region {

/**
 * One compressed record as stored in a region sector run:
 *
 *   u32 length (big-endian) | u8 compression scheme | body[length - 1]
 *
 * followed by zero padding up to the next sector boundary. Only the body is
 * retained; encode() regenerates header and padding.
 */
class RecordPayload
{
public:
    RecordPayload() = default;

    /**
     * Parse a record from the sector run allocated to a slot
     *
     * @param data Start of the slot's sectors
     * @param size Number of bytes allocated to the slot
     * @throws TruncatedPayloadError if the header or body does not fit
     * @throws UnsupportedCompressionError if the scheme is not zlib
     */
    static RecordPayload
    decode(const uint8_t* data, std::size_t size);

    // Header, body and zero padding; empty when the payload was cleared
    std::vector<uint8_t>
    encode() const;

    // Inflate the body (zlib); the result still carries the root frame
    std::vector<uint8_t>
    decompress() const;

    bool
    empty() const
    {
        return !present_;
    }

    void
    clear()
    {
        present_ = false;
        body_.clear();
        body_.shrink_to_fit();
    }

    uint8_t
    compression_scheme() const
    {
        return scheme_;
    }

    const std::vector<uint8_t>&
    compressed_body() const
    {
        return body_;
    }

    // Sectors needed by encode()
    std::size_t
    sector_count() const;

    static RecordPayload
    from_compressed_body(std::vector<uint8_t> body);

private:
    uint8_t scheme_ = csZLIB;
    std::vector<uint8_t> body_;
    bool present_ = false;
};

}  // namespace mctrim::region
