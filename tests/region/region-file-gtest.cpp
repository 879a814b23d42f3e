#include "mctrim/region/chunk-record.h"
#include "mctrim/region/container-io.h"
#include "mctrim/region/region-errors.h"
#include "mctrim/region/region-file.h"
#include "mctrim/test-utils/region-builder.h"
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace mctrim::region;
using namespace mctrim::test_utils;
namespace fs = boost::filesystem;

namespace {

bool
odd_square(const ChunkRecord& chunk)
{
    return (chunk.x_pos() + chunk.z_pos()) % 2 != 0;
}

bool
never(const ChunkRecord&)
{
    return false;
}

bool
always(const ChunkRecord&)
{
    return true;
}

uint32_t
timestamp_for(std::size_t index)
{
    return 1700000000u + static_cast<uint32_t>(index);
}

}  // namespace

class RegionFileTest : public ::testing::Test
{
protected:
    // Every slot populated, chunk i at (i % 32, i / 32)
    static std::vector<uint8_t>
    full_grid()
    {
        RegionBuilder builder;
        for (uint16_t i = 0; i < 1024; ++i)
        {
            builder.add_chunk(i, i % 32, i / 32, i, timestamp_for(i));
        }
        return builder.build();
    }

    TempDir temp_;
};

TEST_F(RegionFileTest, DecodesChunkFields)
{
    RegionBuilder builder;
    builder.add_chunk(37, -5, 12, 123456789, 42);
    RegionFile region(builder.build());

    ASSERT_EQ(region.slots().size(), 1024u);
    EXPECT_EQ(region.populated_count(), 1u);

    const auto& slot = region.slots()[37];
    EXPECT_EQ(slot.index, 37);
    EXPECT_EQ(slot.timestamp.value, 42u);
    EXPECT_EQ(slot.location, (SlotLocation{2, 1}));
    EXPECT_EQ(slot.payload.x_pos(), -5);
    EXPECT_EQ(slot.payload.y_pos(), -4);
    EXPECT_EQ(slot.payload.z_pos(), 12);
    EXPECT_EQ(slot.payload.inhabited_time(), 123456789u);

    EXPECT_TRUE(region.slots()[36].payload.empty());
}

TEST_F(RegionFileTest, RepackWithoutChangesIsIdentical)
{
    RegionBuilder builder;
    builder.add_chunk(0, 0, 0, 10, 1)
        .add_chunk(500, 20, 15, 20, 2, 9000)
        .add_chunk(3, 3, 0, 30, 3);
    std::vector<uint8_t> original = builder.build();

    RegionFile region(original);
    EXPECT_EQ(region.to_bytes(), original);
    EXPECT_EQ(region.to_bytes(), original);
    EXPECT_FALSE(region.dirty());
}

TEST_F(RegionFileTest, SlackAndGapsAreSqueezedOut)
{
    std::vector<uint8_t> body_a = make_chunk_body(1, 1, 1);
    std::vector<uint8_t> body_b = make_chunk_body(2, 2, 2, 6000);

    RegionBuilder loose;
    loose.add(8, body_a, 11, 3, 2).add(2, body_b, 22, 1, 5);
    RegionBuilder tight;
    tight.add(8, body_a, 11).add(2, body_b, 22);

    RegionFile region(loose.build());
    std::vector<uint8_t> packed = region.to_bytes();
    EXPECT_EQ(packed, tight.build());

    // A container written by the engine repacks to itself
    RegionFile reloaded(packed);
    EXPECT_EQ(reloaded.to_bytes(), packed);
}

TEST_F(RegionFileTest, OutputIsSectorAlignedWithFixedTables)
{
    RegionBuilder builder;
    for (uint16_t i = 0; i < 40; ++i)
    {
        builder.add_chunk(i * 25, i, i, i * 100, i, (i % 3) * 5000);
    }
    RegionFile region(builder.build());
    region.trim([](const ChunkRecord& c) { return c.inhabited_time() < 1500; });

    std::vector<uint8_t> bytes = region.to_bytes();
    EXPECT_EQ(bytes.size() % SECTOR_SIZE, 0u);
    EXPECT_GE(bytes.size(), HEADER_SIZE);

    RegionFile reloaded(bytes);
    ASSERT_EQ(reloaded.slots().size(), SLOT_COUNT);
    for (const auto& slot : reloaded.slots())
    {
        if (slot.payload.empty())
        {
            EXPECT_TRUE(slot.location.unused()) << slot.index;
            EXPECT_EQ(slot.timestamp.value, 0u) << slot.index;
        }
        else
        {
            EXPECT_GE(slot.location.offset, FIRST_PAYLOAD_SECTOR);
            EXPECT_GE(slot.payload.inhabited_time(), 1500u);
        }
    }
    EXPECT_EQ(reloaded.populated_count(), 25u);
}

TEST_F(RegionFileTest, NoMatchLeavesContainerClean)
{
    std::vector<uint8_t> original = full_grid();
    RegionFile region(original);

    EXPECT_EQ(region.trim(never), 0u);
    EXPECT_FALSE(region.dirty());
    EXPECT_TRUE(region.cleared_indices().empty());
    EXPECT_EQ(region.to_bytes(), original);
}

TEST_F(RegionFileTest, ClearingIsMonotonic)
{
    RegionBuilder builder;
    builder.add_chunk(1, 1, 0, 5).add_chunk(2, 2, 0, 5000);
    RegionFile region(builder.build());

    EXPECT_EQ(
        region.trim([](const ChunkRecord& c) { return c.x_pos() == 1; }), 1u);
    EXPECT_TRUE(region.dirty());

    // Cleared slots are never offered to the predicate again
    std::size_t calls = 0;
    region.trim([&calls](const ChunkRecord&) {
        ++calls;
        return false;
    });
    EXPECT_EQ(calls, 1u);
    EXPECT_TRUE(region.slots()[1].payload.empty());
    EXPECT_TRUE(region.dirty());
    EXPECT_EQ(region.cleared_indices(), std::vector<uint16_t>{1});
}

TEST_F(RegionFileTest, SingleLowActivityChunkEmptiesFile)
{
    RegionBuilder builder;
    builder.add_chunk(5, 1, 288, 500, 1234);
    RegionFile region(builder.build());

    EXPECT_EQ(
        region.trim([](const ChunkRecord& c) {
            return c.inhabited_time() <= 1200;
        }),
        1u);
    EXPECT_EQ(region.populated_count(), 0u);

    std::vector<uint8_t> bytes = region.to_bytes();
    ASSERT_EQ(bytes.size(), HEADER_SIZE);
    for (uint8_t b : bytes)
    {
        ASSERT_EQ(b, 0);
    }

    fs::path target = temp_.path() / "r.0.9.mca";
    write_file(target, builder.build());
    EXPECT_EQ(region.save_to_file(target.string()), SaveOutcome::REMOVED);
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(RegionFileTest, CheckerboardKeepsEvenSquares)
{
    RegionFile region(full_grid());
    EXPECT_EQ(region.trim(odd_square), 512u);
    EXPECT_TRUE(region.dirty());

    RegionBuilder expected;
    for (uint16_t i = 0; i < 1024; ++i)
    {
        if ((i % 32 + i / 32) % 2 == 0)
            expected.add_chunk(i, i % 32, i / 32, i, timestamp_for(i));
    }
    EXPECT_EQ(region.to_bytes(), expected.build());
}

TEST_F(RegionFileTest, CheckerboardOnReversedMultiSectorLayout)
{
    // Physical order is the reverse of index order, some records span
    // several sectors and carry slack
    auto noise_for = [](uint16_t i) -> std::size_t {
        return i % 7 == 0 ? 6000 + (i % 3) * 4096 : 0;
    };

    RegionBuilder scattered;
    RegionBuilder expected;
    for (int i = 1023; i >= 0; --i)
    {
        const uint16_t index = static_cast<uint16_t>(i);
        std::vector<uint8_t> body =
            make_chunk_body(index % 32, index / 32, index, noise_for(index));
        const uint8_t slack = index % 5 == 0 ? 1 : 0;
        scattered.add(index, body, timestamp_for(index), slack);
        if ((index % 32 + index / 32) % 2 == 0)
            expected.add(index, body, timestamp_for(index));
    }

    RegionFile region(scattered.build());
    EXPECT_EQ(region.trim(odd_square), 512u);
    std::vector<uint8_t> bytes = region.to_bytes();
    EXPECT_EQ(bytes, expected.build());

    // Survivors are still in descending index order on disk
    RegionFile reloaded(bytes);
    EXPECT_GT(
        reloaded.slots()[0].location.offset,
        reloaded.slots()[1023].location.offset);
}

TEST_F(RegionFileTest, ClearingEverythingLeavesBareTables)
{
    RegionFile region(full_grid());
    EXPECT_EQ(region.trim(always), 1024u);
    EXPECT_EQ(region.to_bytes(), std::vector<uint8_t>(HEADER_SIZE, 0));
}

TEST_F(RegionFileTest, SaveWritesCompactedImage)
{
    RegionFile region(full_grid());
    region.trim(odd_square);

    fs::path target = temp_.path() / "out" / "r.1.1.mca";
    fs::create_directories(target.parent_path());
    EXPECT_EQ(region.save_to_file(target.string()), SaveOutcome::WRITTEN);
    EXPECT_EQ(read_file(target), region.to_bytes());
    EXPECT_FALSE(fs::exists(target.string() + ".tmp"));

    RegionFile reloaded = RegionFile::from_file(target.string());
    EXPECT_EQ(reloaded.populated_count(), 512u);
    EXPECT_FALSE(reloaded.dirty());
}

TEST_F(RegionFileTest, RejectsFileShorterThanTables)
{
    std::vector<uint8_t> bytes(HEADER_SIZE - 1, 0);
    EXPECT_THROW(RegionFile region(bytes), InvalidHeaderError);
}

TEST_F(RegionFileTest, EmptyTablesAreValid)
{
    RegionFile region(std::vector<uint8_t>(HEADER_SIZE, 0));
    EXPECT_EQ(region.slots().size(), SLOT_COUNT);
    EXPECT_EQ(region.populated_count(), 0u);
}

TEST_F(RegionFileTest, RejectsLocationInsideHeader)
{
    std::vector<uint8_t> bytes = RegionBuilder().add_chunk(0, 0, 0, 0).build();
    bytes[2] = 1;  // offset 2 -> 1
    EXPECT_THROW(RegionFile region(bytes), InvalidHeaderError);
}

TEST_F(RegionFileTest, RejectsLocationPastEnd)
{
    std::vector<uint8_t> bytes = RegionBuilder().add_chunk(0, 0, 0, 0).build();
    bytes[2] = 9;
    EXPECT_THROW(RegionFile region(bytes), TruncatedPayloadError);
}

TEST_F(RegionFileTest, AcceptsUnpaddedFinalRecord)
{
    std::vector<uint8_t> body = make_chunk_body(4, 4, 77);
    std::vector<uint8_t> bytes = RegionBuilder().add(0, body).build();
    bytes.resize(HEADER_SIZE + RECORD_HEADER_SIZE + body.size());

    RegionFile region(bytes);
    EXPECT_EQ(region.slots()[0].payload.inhabited_time(), 77u);
}

TEST_F(RegionFileTest, RejectsUnsupportedCompression)
{
    std::vector<uint8_t> record = encode_record(make_chunk_body(0, 0, 0), 1);
    std::vector<uint8_t> bytes = RegionBuilder().add_raw(0, record).build();
    EXPECT_THROW(RegionFile region(bytes), UnsupportedCompressionError);
}

TEST_F(RegionFileTest, RejectsCorruptZlib)
{
    std::vector<uint8_t> garbage(64, 0x5C);
    std::vector<uint8_t> bytes = RegionBuilder().add(0, garbage).build();
    EXPECT_THROW(RegionFile region(bytes), DecompressionError);
}

TEST_F(RegionFileTest, MissingFieldSurfacesFromAccessor)
{
    FieldStreamBuilder fields;
    fields.add_int("xPos", 1).add_int("zPos", 2);
    std::vector<uint8_t> bytes =
        RegionBuilder().add(0, zlib_compress(fields.build_root())).build();

    RegionFile region(bytes);
    EXPECT_THROW(
        region.trim([](const ChunkRecord& c) {
            return c.inhabited_time() == 0;
        }),
        FieldNotFoundError);
}

TEST_F(RegionFileTest, FromFileReportsMissingFile)
{
    EXPECT_THROW(
        RegionFile::from_file((temp_.path() / "absent.mca").string()),
        ContainerIOError);
}
