// faraid/cpp/include/faraid/exclusion.h
#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "faraid/normalizer.h"
#include "faraid/roster.h"

namespace faraid {

struct ExclusionResult {
    std::unordered_set<std::string> excluded_ids;
    std::unordered_map<std::string, std::string> reasons; // heir id -> reason
    std::vector<std::string> notes;                       // roster order
};

// Name of the relative that blocks `r` given the roster, empty if `r` inherits.
// Never returns empty for Relationship::Excluded.
std::string blocking_relative(Relationship r, const RosterFacts& roster);

// Hajb: evaluate every heir against roster-wide predicates (`roster` must be
// facts_for() over the full normalized roster).
ExclusionResult resolve_exclusions(const std::vector<NormalizedHeir>& heirs,
                                   const RosterFacts& roster);

} // namespace faraid
