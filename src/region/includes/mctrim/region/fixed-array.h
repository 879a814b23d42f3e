#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mctrim/region/region-errors.h"
#include "mctrim/region/region-types.h"

namespace mctrim::region {

/**
 * A value with a fixed on-disk width.
 *
 * Example:
 * ```cpp
 * struct Marker {
 *     static constexpr std::size_t WIDTH = 4;
 *     void encode(uint8_t* out) const;
 *     static Marker decode(const uint8_t* in);
 * };
 * ```
 */
template <typename T>
concept FixedWidthCodec = std::default_initializable<T> &&
    requires(const T& value, uint8_t* out, const uint8_t* in)
{
    {
        T::WIDTH
    }
    ->std::convertible_to<std::size_t>;
    value.encode(out);
    {
        T::decode(in)
    }
    ->std::same_as<T>;
};

/**
 * N fixed-width entries stored back to back. The encoding is always
 * N * T::WIDTH bytes; default constructed entries encode as zeros.
 */
template <FixedWidthCodec T, std::size_t N>
class FixedArray
{
public:
    static constexpr std::size_t BYTE_SIZE = T::WIDTH * N;

    static FixedArray
    decode(const uint8_t* data, std::size_t size)
    {
        if (size < BYTE_SIZE)
        {
            throw InvalidHeaderError(
                "Table needs " + std::to_string(BYTE_SIZE) + " bytes, got " +
                std::to_string(size));
        }

        FixedArray array;
        for (std::size_t i = 0; i < N; ++i)
        {
            array.items_[i] = T::decode(data + i * T::WIDTH);
        }
        return array;
    }

    void
    encode(uint8_t* out) const
    {
        for (std::size_t i = 0; i < N; ++i)
        {
            items_[i].encode(out + i * T::WIDTH);
        }
    }

    std::vector<uint8_t>
    to_bytes() const
    {
        std::vector<uint8_t> bytes(BYTE_SIZE);
        encode(bytes.data());
        return bytes;
    }

    T&
    operator[](std::size_t i)
    {
        return items_[i];
    }

    const T&
    operator[](std::size_t i) const
    {
        return items_[i];
    }

    static constexpr std::size_t
    size()
    {
        return N;
    }

private:
    std::array<T, N> items_{};
};

using LocationTable = FixedArray<SlotLocation, SLOT_COUNT>;
using TimestampTable = FixedArray<Timestamp, SLOT_COUNT>;

static_assert(LocationTable::BYTE_SIZE == LOCATION_TABLE_SIZE);
static_assert(TimestampTable::BYTE_SIZE == TIMESTAMP_TABLE_SIZE);

}  // namespace mctrim::region
