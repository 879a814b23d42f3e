#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mctrim/region/chunk-record.h"

namespace mctrim::trimmer {

static constexpr uint64_t TICKS_PER_SECOND = 20;

enum class CriterionKind {
    INHABITED_TIME_AT_MOST  // trim when InhabitedTime <= threshold ticks
};

/**
 * A named retention rule selectable from the command line.
 *
 * Criteria only look at a chunk through the fast field scan accessors of
 * ChunkRecord, never through a full decode.
 */
class TrimCriterion
{
public:
    static TrimCriterion
    inhabited_time_at_most(std::string name, uint64_t ticks);

    const std::string&
    name() const
    {
        return name_;
    }

    CriterionKind
    kind() const
    {
        return kind_;
    }

    uint64_t
    threshold() const
    {
        return threshold_;
    }

    // true means the chunk gets trimmed
    bool
    matches(const region::ChunkRecord& chunk) const;

    region::ChunkPredicate
    predicate() const;

private:
    TrimCriterion(std::string name, CriterionKind kind, uint64_t threshold);

    std::string name_;
    CriterionKind kind_;
    uint64_t threshold_;
};

// inhabited_time<15s, <30s, <1m, <2m, <3m, <5m, <10m
const std::vector<TrimCriterion>&
known_criteria();

std::optional<TrimCriterion>
find_criterion(const std::string& name);

std::vector<std::string>
criterion_names();

}  // namespace mctrim::trimmer
