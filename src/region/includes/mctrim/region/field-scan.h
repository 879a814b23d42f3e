#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "mctrim/core/byte-order.h"

namespace mctrim::region {

// Tag ids of the world-data compound format
enum TagType : uint8_t {
    ttEND = 0,
    ttBYTE = 1,
    ttSHORT = 2,
    ttINT = 3,
    ttLONG = 4,
    ttFLOAT = 5,
    ttDOUBLE = 6,
    ttBYTE_ARRAY = 7,
    ttSTRING = 8,
    ttLIST = 9,
    ttCOMPOUND = 10,
    ttINT_ARRAY = 11,
    ttLONG_ARRAY = 12
};

// Root tag id, u16 name length; stripped from every inflated record
static constexpr std::size_t ROOT_FRAME_SIZE = 3;

template <TagType Type>
struct ScanStrategy;

template <>
struct ScanStrategy<ttBYTE>
{
    using value_type = int8_t;
    static constexpr std::size_t WIDTH = 1;
    static value_type
    read(const uint8_t* p)
    {
        return static_cast<int8_t>(p[0]);
    }
};

template <>
struct ScanStrategy<ttINT>
{
    using value_type = int32_t;
    static constexpr std::size_t WIDTH = 4;
    static value_type
    read(const uint8_t* p)
    {
        return static_cast<int32_t>(core::get_uint32_be(p));
    }
};

// Read as unsigned, the way the trimming criteria have always compared it
template <>
struct ScanStrategy<ttLONG>
{
    using value_type = uint64_t;
    static constexpr std::size_t WIDTH = 8;
    static value_type
    read(const uint8_t* p)
    {
        return core::get_uint64_be(p);
    }
};

template <>
struct ScanStrategy<ttFLOAT>
{
    using value_type = float;
    static constexpr std::size_t WIDTH = 4;
    static value_type
    read(const uint8_t* p)
    {
        return std::bit_cast<float>(core::get_uint32_be(p));
    }
};

template <>
struct ScanStrategy<ttDOUBLE>
{
    using value_type = double;
    static constexpr std::size_t WIDTH = 8;
    static value_type
    read(const uint8_t* p)
    {
        return std::bit_cast<double>(core::get_uint64_be(p));
    }
};

/**
 * Find the value bytes of a named field by searching the raw field stream
 * for `type_id | u16 name length | name`.
 *
 * This is a byte search, not a parse: the first occurrence wins, even when
 * it belongs to a nested compound or happens to appear inside another
 * value. Only use it for names that are unique within a record.
 *
 * @return Offset of the first value byte
 * @throws FieldNotFoundError if the pattern does not occur
 * @throws TruncatedPayloadError if fewer than width bytes follow the match
 */
std::size_t
locate_field(
    const uint8_t* data,
    std::size_t size,
    uint8_t type_id,
    std::string_view name,
    std::size_t width);

template <TagType Type>
typename ScanStrategy<Type>::value_type
scan_field(const std::vector<uint8_t>& fields, std::string_view name)
{
    using Strategy = ScanStrategy<Type>;
    const std::size_t at = locate_field(
        fields.data(), fields.size(), Type, name, Strategy::WIDTH);
    return Strategy::read(fields.data() + at);
}

}  // namespace mctrim::region
