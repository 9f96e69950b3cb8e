// faraid/cpp/include/faraid/roster.h
#pragma once
#include <array>
#include <string>
#include <unordered_set>
#include <vector>

#include "faraid/normalizer.h"
#include "faraid/relationship.h"

namespace faraid {

// Roster-wide predicates, computed once per invocation and passed to every rule.
struct RosterFacts {
    std::array<int, kRelationshipCount> counts{};

    int count(Relationship r) const { return counts[index_of(r)]; }
    bool has(Relationship r) const { return count(r) > 0; }

    bool has_male_descendant() const {
        return has(Relationship::Son) || has(Relationship::Grandson);
    }
    bool has_female_descendant() const {
        return has(Relationship::Daughter) || has(Relationship::Granddaughter);
    }
    bool has_descendant() const { return has_male_descendant() || has_female_descendant(); }
    bool has_male_ascendant() const {
        return has(Relationship::Father) || has(Relationship::Grandfather);
    }
    int sibling_count() const;
    int uterine_count() const {
        return count(Relationship::UterineBrother) + count(Relationship::UterineSister);
    }
};

// Facts over every normalized heir (the Excluded bucket is not counted).
RosterFacts facts_for(const std::vector<NormalizedHeir>& roster);

// Facts over the heirs whose id is not in `excluded_ids`.
RosterFacts facts_for(const std::vector<NormalizedHeir>& roster,
                      const std::unordered_set<std::string>& excluded_ids);

} // namespace faraid
