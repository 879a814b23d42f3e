#include "mctrim/region/field-scan.h"
#include "mctrim/region/region-errors.h"

#include <algorithm>
#include <string>
#include <vector>

namespace mctrim::region {

std::size_t
locate_field(
    const uint8_t* data,
    std::size_t size,
    uint8_t type_id,
    std::string_view name,
    std::size_t width)
{
    std::vector<uint8_t> needle(3 + name.size());
    needle[0] = type_id;
    core::put_uint16_be(&needle[1], static_cast<uint16_t>(name.size()));
    std::copy(name.begin(), name.end(), needle.begin() + 3);

    const uint8_t* end = data + size;
    const uint8_t* match =
        std::search(data, end, needle.begin(), needle.end());
    if (match == end)
    {
        throw FieldNotFoundError(
            "Field '" + std::string(name) + "' not found");
    }

    const std::size_t value_at = (match - data) + needle.size();
    if (size - value_at < width)
    {
        throw TruncatedPayloadError(
            "Field '" + std::string(name) + "' is cut off after " +
            std::to_string(size - value_at) + " value bytes");
    }
    return value_at;
}

}  // namespace mctrim::region
