#include "mctrim/region/record-payload.h"
#include "mctrim/core/byte-order.h"
#include "mctrim/region/region-errors.h"

#include <algorithm>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace mctrim::region {

RecordPayload
RecordPayload::decode(const uint8_t* data, std::size_t size)
{
    if (size < RECORD_HEADER_SIZE)
    {
        throw TruncatedPayloadError(
            "Record slice of " + std::to_string(size) +
            " bytes cannot hold a record header");
    }

    const uint32_t length = core::get_uint32_be(data);
    const uint8_t scheme = data[4];

    if (scheme != csZLIB)
    {
        throw UnsupportedCompressionError(
            "Unsupported compression scheme " +
            std::to_string(static_cast<int>(scheme)) + " (only zlib is read)");
    }

    // length counts the scheme byte
    if (length == 0)
    {
        throw TruncatedPayloadError("Record length 0 excludes scheme byte");
    }

    const std::size_t body_size = length - 1;
    if (body_size > size - RECORD_HEADER_SIZE)
    {
        throw TruncatedPayloadError(
            "Record body of " + std::to_string(body_size) +
            " bytes exceeds its " + std::to_string(size) + " byte slice");
    }

    RecordPayload payload;
    payload.scheme_ = scheme;
    payload.body_.assign(
        data + RECORD_HEADER_SIZE, data + RECORD_HEADER_SIZE + body_size);
    payload.present_ = true;
    return payload;
}

RecordPayload
RecordPayload::from_compressed_body(std::vector<uint8_t> body)
{
    RecordPayload payload;
    payload.body_ = std::move(body);
    payload.present_ = true;
    return payload;
}

std::size_t
RecordPayload::sector_count() const
{
    if (!present_)
        return 0;
    return (RECORD_HEADER_SIZE + body_.size() + SECTOR_SIZE - 1) / SECTOR_SIZE;
}

std::vector<uint8_t>
RecordPayload::encode() const
{
    if (!present_)
        return {};

    std::vector<uint8_t> bytes(sector_count() * SECTOR_SIZE, 0);
    core::put_uint32_be(bytes.data(), static_cast<uint32_t>(body_.size() + 1));
    bytes[4] = scheme_;
    std::copy(body_.begin(), body_.end(), bytes.begin() + RECORD_HEADER_SIZE);
    return bytes;
}

std::vector<uint8_t>
RecordPayload::decompress() const
{
    if (!present_)
    {
        throw DecompressionError("Cannot decompress an empty record");
    }

    std::vector<uint8_t> out;
    try
    {
        boost::iostreams::filtering_istream in;
        in.push(boost::iostreams::zlib_decompressor());
        in.push(boost::iostreams::array_source(
            reinterpret_cast<const char*>(body_.data()), body_.size()));

        constexpr std::size_t BUFFER_SIZE = 64 * 1024;
        std::vector<char> buffer(BUFFER_SIZE);
        while (in)
        {
            in.read(buffer.data(), buffer.size());
            const auto got = static_cast<std::size_t>(in.gcount());
            out.insert(out.end(), buffer.begin(), buffer.begin() + got);
        }

        if (in.bad())
        {
            throw DecompressionError("zlib stream is corrupt");
        }
    }
    catch (const DecompressionError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw DecompressionError(
            std::string("Failed to inflate record: ") + e.what());
    }

    return out;
}

}  // namespace mctrim::region
