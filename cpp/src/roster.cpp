#include "faraid/roster.h"

namespace faraid {

int RosterFacts::sibling_count() const {
    int n = 0;
    for (Relationship r : kAllRelationships) {
        if (is_sibling(r)) n += count(r);
    }
    return n;
}

RosterFacts facts_for(const std::vector<NormalizedHeir>& roster) {
    static const std::unordered_set<std::string> kNone;
    return facts_for(roster, kNone);
}

RosterFacts facts_for(const std::vector<NormalizedHeir>& roster,
                      const std::unordered_set<std::string>& excluded_ids) {
    RosterFacts f;
    for (const auto& h : roster) {
        if (h.relationship == Relationship::Excluded) continue;
        if (excluded_ids.count(h.heir.id)) continue;
        ++f.counts[index_of(h.relationship)];
    }
    return f;
}

} // namespace faraid
