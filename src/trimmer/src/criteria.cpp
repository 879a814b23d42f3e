#include "mctrim/trimmer/criteria.h"

#include <algorithm>
#include <utility>

namespace mctrim::trimmer {

TrimCriterion::TrimCriterion(
    std::string name,
    CriterionKind kind,
    uint64_t threshold)
    : name_(std::move(name)), kind_(kind), threshold_(threshold)
{
}

TrimCriterion
TrimCriterion::inhabited_time_at_most(std::string name, uint64_t ticks)
{
    return TrimCriterion(
        std::move(name), CriterionKind::INHABITED_TIME_AT_MOST, ticks);
}

bool
TrimCriterion::matches(const region::ChunkRecord& chunk) const
{
    switch (kind_)
    {
        case CriterionKind::INHABITED_TIME_AT_MOST:
            return chunk.inhabited_time() <= threshold_;
    }
    return false;
}

region::ChunkPredicate
TrimCriterion::predicate() const
{
    TrimCriterion self = *this;
    return [self](const region::ChunkRecord& chunk) {
        return self.matches(chunk);
    };
}

const std::vector<TrimCriterion>&
known_criteria()
{
    static const std::vector<TrimCriterion> criteria = {
        TrimCriterion::inhabited_time_at_most(
            "inhabited_time<15s", 15 * TICKS_PER_SECOND),
        TrimCriterion::inhabited_time_at_most(
            "inhabited_time<30s", 30 * TICKS_PER_SECOND),
        TrimCriterion::inhabited_time_at_most(
            "inhabited_time<1m", 60 * TICKS_PER_SECOND),
        TrimCriterion::inhabited_time_at_most(
            "inhabited_time<2m", 2 * 60 * TICKS_PER_SECOND),
        TrimCriterion::inhabited_time_at_most(
            "inhabited_time<3m", 3 * 60 * TICKS_PER_SECOND),
        TrimCriterion::inhabited_time_at_most(
            "inhabited_time<5m", 5 * 60 * TICKS_PER_SECOND),
        TrimCriterion::inhabited_time_at_most(
            "inhabited_time<10m", 10 * 60 * TICKS_PER_SECOND)};
    return criteria;
}

std::optional<TrimCriterion>
find_criterion(const std::string& name)
{
    const auto& criteria = known_criteria();
    auto it = std::find_if(
        criteria.begin(), criteria.end(), [&name](const TrimCriterion& c) {
            return c.name() == name;
        });
    if (it == criteria.end())
        return std::nullopt;
    return *it;
}

std::vector<std::string>
criterion_names()
{
    std::vector<std::string> names;
    for (const auto& criterion : known_criteria())
    {
        names.push_back(criterion.name());
    }
    return names;
}

}  // namespace mctrim::trimmer
