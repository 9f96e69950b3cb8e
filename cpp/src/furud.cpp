// faraid/cpp/src/furud.cpp
#include "faraid/furud.h"
#include "faraid/allocation.h"

namespace faraid {

namespace {

using R = Relationship;

// 1/2 for a single heir, 2/3 shared by two or more
int64_t half_or_two_thirds(int count) {
    if (count <= 0) return 0;
    return count == 1 ? 12 : 16;
}

// Uterine brothers and sisters share one pool.
Relationship pool_key(Relationship r) {
    return r == R::UterineSister ? R::UterineBrother : r;
}

// Parts out of 24 held by the whole category `r`; 0 when it takes no fixed share.
int64_t fixed_pool(Relationship r, const ShareContext& ctx) {
    const RosterFacts& a = ctx.active;

    switch (r) {
        case R::Husband:
            return a.has_descendant() ? 6 : 12;
        case R::Wife:
            return a.has_descendant() ? 3 : 6;
        case R::Father:
        case R::Grandfather:
            // with a male descendant: 1/6 only; female descendants only: 1/6 + residue;
            // no descendants: pure residuary
            return a.has_descendant() ? 4 : 0;
        case R::Mother:
            return (a.has_descendant() || ctx.mother_sibling_count >= 2) ? 4 : 8;
        case R::Grandmother:
            return 4;

        case R::Son:
        case R::Grandson:
        case R::FullBrother:
        case R::ConsanguineBrother:
        case R::FullNephew:
        case R::Excluded:
            return 0;

        case R::Daughter:
            if (a.has(R::Son)) return 0;
            return half_or_two_thirds(a.count(R::Daughter));

        case R::Granddaughter:
            if (a.has(R::Grandson)) return 0;
            if (a.count(R::Daughter) == 0) return half_or_two_thirds(a.count(R::Granddaughter));
            // completes 2/3 with a single Daughter
            if (a.count(R::Daughter) == 1) return 4;
            return 0;

        case R::FullSister:
            if (a.has(R::FullBrother) || a.has_descendant() || a.has_male_ascendant()) return 0;
            return half_or_two_thirds(a.count(R::FullSister));

        case R::ConsanguineSister:
            if (a.has(R::ConsanguineBrother) || a.has_descendant() || a.has_male_ascendant()) return 0;
            if (a.count(R::FullSister) == 0) return half_or_two_thirds(a.count(R::ConsanguineSister));
            if (a.count(R::FullSister) == 1) return 4;
            return 0;

        case R::UterineBrother:
        case R::UterineSister: {
            const int c = a.uterine_count();
            if (c == 0) return 0;
            return c == 1 ? 4 : 8;
        }
    }
    return 0;
}

} // namespace

FurudResult assign_fixed_shares(const std::vector<NormalizedHeir>& heirs,
                                const ExclusionResult& exclusions,
                                const ShareContext& ctx) {
    FurudResult res;

    for (std::size_t i = 0; i < heirs.size(); ++i) {
        const auto& h = heirs[i];
        if (h.relationship == R::Excluded) continue;
        if (exclusions.excluded_ids.count(h.heir.id)) continue;

        HeirAllocation a;
        a.index = i;
        a.relationship = h.relationship;
        res.shares.push_back(std::move(a));
    }

    for (Relationship key : kAllRelationships) {
        if (pool_key(key) != key) continue;

        std::vector<HeirAllocation*> members;
        for (auto& s : res.shares) {
            if (pool_key(s.relationship) == key) members.push_back(&s);
        }
        if (members.empty()) continue;

        const int64_t pool = fixed_pool(key, ctx);
        if (pool == 0) continue;

        const auto parts = split_pool(Fraction(pool), members, [](const HeirAllocation*) { return 1; });

        std::string label = Fraction(pool, kBaseParts).to_string();
        if (members.size() > 1) label += " shared";

        for (std::size_t k = 0; k < members.size(); ++k) {
            members[k]->fixed = parts[k];
            members[k]->fixed_label = label;
            res.fixed_total += parts[k];
        }
    }

    return res;
}

} // namespace faraid
