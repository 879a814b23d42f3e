#include "mctrim/region/field-scan.h"
#include "mctrim/region/region-errors.h"
#include "mctrim/test-utils/region-builder.h"
#include <gtest/gtest.h>
#include <vector>

using namespace mctrim::region;
using namespace mctrim::test_utils;

TEST(FieldScan, ReadsEachScalarType)
{
    FieldStreamBuilder builder;
    builder.add_byte("Status", -3)
        .add_int("xPos", -123456)
        .add_long("InhabitedTime", 0x0102030405060708ULL)
        .add_float("Ratio", 1.5f)
        .add_double("Scale", -0.25);
    const std::vector<uint8_t>& fields = builder.fields();

    EXPECT_EQ(scan_field<ttBYTE>(fields, "Status"), -3);
    EXPECT_EQ(scan_field<ttINT>(fields, "xPos"), -123456);
    EXPECT_EQ(
        scan_field<ttLONG>(fields, "InhabitedTime"), 0x0102030405060708ULL);
    EXPECT_FLOAT_EQ(scan_field<ttFLOAT>(fields, "Ratio"), 1.5f);
    EXPECT_DOUBLE_EQ(scan_field<ttDOUBLE>(fields, "Scale"), -0.25);
}

TEST(FieldScan, LongIsReadUnsigned)
{
    FieldStreamBuilder builder;
    builder.add_long("InhabitedTime", 0xFFFFFFFFFFFFFFFFULL);
    EXPECT_EQ(
        scan_field<ttLONG>(builder.fields(), "InhabitedTime"),
        0xFFFFFFFFFFFFFFFFULL);
}

TEST(FieldScan, MissingFieldThrows)
{
    FieldStreamBuilder builder;
    builder.add_int("xPos", 1);
    EXPECT_THROW(
        scan_field<ttINT>(builder.fields(), "zPos"), FieldNotFoundError);
}

TEST(FieldScan, TypeIsPartOfThePattern)
{
    FieldStreamBuilder builder;
    builder.add_int("InhabitedTime", 5);
    EXPECT_THROW(
        scan_field<ttLONG>(builder.fields(), "InhabitedTime"),
        FieldNotFoundError);
    EXPECT_EQ(scan_field<ttINT>(builder.fields(), "InhabitedTime"), 5);
}

TEST(FieldScan, NameMustMatchExactLength)
{
    // "xPosition" must not satisfy a lookup for "xPos"
    FieldStreamBuilder builder;
    builder.add_int("xPosition", 9);
    EXPECT_THROW(
        scan_field<ttINT>(builder.fields(), "xPos"), FieldNotFoundError);
}

TEST(FieldScan, FirstOccurrenceWinsEvenWhenNested)
{
    FieldStreamBuilder builder;
    builder.begin_compound("Level")
        .add_long("InhabitedTime", 10)
        .end_compound()
        .add_long("InhabitedTime", 99999);

    EXPECT_EQ(scan_field<ttLONG>(builder.fields(), "InhabitedTime"), 10u);
}

TEST(FieldScan, TruncatedValueThrows)
{
    FieldStreamBuilder builder;
    builder.add_long("InhabitedTime", 1);
    std::vector<uint8_t> fields = builder.fields();
    fields.resize(fields.size() - 3);

    EXPECT_THROW(
        scan_field<ttLONG>(fields, "InhabitedTime"), TruncatedPayloadError);
}

TEST(FieldScan, LocateReturnsValueOffset)
{
    FieldStreamBuilder builder;
    builder.add_byte("a", 1).add_int("bb", 2);
    // 1 + 2 + 1 + 1 (byte field) then 1 + 2 + 2 (int header)
    EXPECT_EQ(
        locate_field(
            builder.fields().data(), builder.fields().size(), ttINT, "bb", 4),
        10u);
}
