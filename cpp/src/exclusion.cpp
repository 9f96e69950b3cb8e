// faraid/cpp/src/exclusion.cpp
#include "faraid/exclusion.h"

namespace faraid {

namespace {

using R = Relationship;

std::string male_descendant_or_father(const RosterFacts& f) {
    if (f.has(R::Son)) return "Son";
    if (f.has(R::Grandson)) return "Grandson";
    if (f.has(R::Father)) return "Father";
    return {};
}

} // namespace

std::string blocking_relative(Relationship r, const RosterFacts& f) {
    switch (r) {
        case R::Husband:
        case R::Wife:
        case R::Father:
        case R::Mother:
        case R::Son:
        case R::Daughter:
            return {};

        case R::Grandson:
            return f.has(R::Son) ? "Son" : "";

        case R::Granddaughter:
            if (f.has(R::Son)) return "Son";
            // a Grandson turns them into co-residuaries instead
            if (f.count(R::Daughter) >= 2 && !f.has(R::Grandson)) return "two or more Daughters";
            return {};

        case R::Grandfather:
            return f.has(R::Father) ? "Father" : "";

        case R::Grandmother:
            return f.has(R::Mother) ? "Mother" : "";

        case R::FullBrother:
        case R::FullSister:
            return male_descendant_or_father(f);

        case R::ConsanguineBrother:
        case R::ConsanguineSister: {
            std::string b = male_descendant_or_father(f);
            if (b.empty() && f.has(R::FullBrother)) b = "Full Brother";
            return b;
        }

        case R::UterineBrother:
        case R::UterineSister: {
            std::string b = male_descendant_or_father(f);
            if (!b.empty()) return b;
            if (f.has(R::Daughter)) return "Daughter";
            if (f.has(R::Granddaughter)) return "Granddaughter";
            if (f.has(R::Grandfather)) return "Grandfather";
            return {};
        }

        case R::FullNephew:
            if (f.has(R::Son)) return "Son";
            if (f.has(R::Grandson)) return "Grandson";
            if (f.has(R::Father)) return "Father";
            if (f.has(R::Grandfather)) return "Grandfather";
            if (f.has(R::FullBrother)) return "Full Brother";
            return {};

        case R::Excluded:
            return "categorical bar";
    }
    return "categorical bar";
}

ExclusionResult resolve_exclusions(const std::vector<NormalizedHeir>& heirs,
                                   const RosterFacts& roster) {
    ExclusionResult res;

    for (const auto& h : heirs) {
        if (h.relationship == R::Excluded) {
            const std::string why = h.reason.empty() ? std::string("relationship does not inherit") : h.reason;
            res.excluded_ids.insert(h.heir.id);
            res.reasons[h.heir.id] = why;
            res.notes.push_back(h.heir.name + " (" + h.heir.relationship + ") is excluded: " + why);
            continue;
        }

        const std::string blocker = blocking_relative(h.relationship, roster);
        if (blocker.empty()) continue;

        res.excluded_ids.insert(h.heir.id);
        res.reasons[h.heir.id] = "blocked by " + blocker;
        res.notes.push_back(h.heir.name + " (" + std::string(to_string(h.relationship)) +
                            ") is excluded by the presence of " + blocker);
    }
    return res;
}

} // namespace faraid
