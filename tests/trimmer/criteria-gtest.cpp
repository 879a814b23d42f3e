#include "mctrim/region/chunk-record.h"
#include "mctrim/region/region-file.h"
#include "mctrim/test-utils/region-builder.h"
#include "mctrim/trimmer/criteria.h"
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

using namespace mctrim::trimmer;
using mctrim::region::RegionFile;
using mctrim::test_utils::RegionBuilder;

namespace {

// Chunks at index i with InhabitedTime ticks[i]
RegionFile
region_with(const std::vector<uint64_t>& ticks)
{
    RegionBuilder builder;
    for (std::size_t i = 0; i < ticks.size(); ++i)
    {
        const auto index = static_cast<uint16_t>(i);
        builder.add_chunk(index, index, 0, ticks[i]);
    }
    return RegionFile(builder.build());
}

}  // namespace

TEST(Criteria, NamesAndThresholds)
{
    const std::vector<std::pair<std::string, uint64_t>> expected = {
        {"inhabited_time<15s", 300},
        {"inhabited_time<30s", 600},
        {"inhabited_time<1m", 1200},
        {"inhabited_time<2m", 2400},
        {"inhabited_time<3m", 3600},
        {"inhabited_time<5m", 6000},
        {"inhabited_time<10m", 12000}};

    ASSERT_EQ(known_criteria().size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        EXPECT_EQ(known_criteria()[i].name(), expected[i].first);
        EXPECT_EQ(known_criteria()[i].threshold(), expected[i].second);
        EXPECT_EQ(
            known_criteria()[i].kind(), CriterionKind::INHABITED_TIME_AT_MOST);
    }

    std::vector<std::string> names = criterion_names();
    EXPECT_EQ(names.front(), "inhabited_time<15s");
    EXPECT_EQ(names.back(), "inhabited_time<10m");
}

TEST(Criteria, LookupByName)
{
    auto criterion = find_criterion("inhabited_time<1m");
    ASSERT_TRUE(criterion.has_value());
    EXPECT_EQ(criterion->threshold(), 1200u);

    EXPECT_FALSE(find_criterion("inhabited_time<1h").has_value());
    EXPECT_FALSE(find_criterion("").has_value());
}

TEST(Criteria, ThresholdIsInclusive)
{
    RegionFile region = region_with({0, 1199, 1200, 1201, 50000});
    auto criterion = *find_criterion("inhabited_time<1m");

    const auto& slots = region.slots();
    EXPECT_TRUE(criterion.matches(slots[0].payload));
    EXPECT_TRUE(criterion.matches(slots[1].payload));
    EXPECT_TRUE(criterion.matches(slots[2].payload));
    EXPECT_FALSE(criterion.matches(slots[3].payload));
    EXPECT_FALSE(criterion.matches(slots[4].payload));
}

TEST(Criteria, PredicateDrivesTrim)
{
    RegionFile region = region_with({100, 400, 700, 100000});
    auto criterion = *find_criterion("inhabited_time<30s");
    EXPECT_EQ(region.trim(criterion.predicate()), 2u);
    EXPECT_EQ(region.cleared_indices(), (std::vector<uint16_t>{0, 1}));
    EXPECT_EQ(region.populated_count(), 2u);
}

TEST(Criteria, CustomThreshold)
{
    TrimCriterion criterion =
        TrimCriterion::inhabited_time_at_most("custom", 5);
    RegionFile region = region_with({5, 6});
    EXPECT_TRUE(criterion.matches(region.slots()[0].payload));
    EXPECT_FALSE(criterion.matches(region.slots()[1].payload));
    EXPECT_EQ(criterion.name(), "custom");
}
