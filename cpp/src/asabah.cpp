// faraid/cpp/src/asabah.cpp
#include "faraid/asabah.h"
#include "faraid/allocation.h"

#include <algorithm>

namespace faraid {

namespace {

using R = Relationship;

std::string parts_text(const Fraction& f) {
    return f.to_string() + (f == Fraction(1) ? " part" : " parts");
}

// "Mother, Daughter" (distinct relationship names, first-seen order)
std::string category_list(const std::vector<HeirAllocation*>& members) {
    std::vector<std::string_view> seen;
    std::string out;
    for (const auto* m : members) {
        const std::string_view n = to_string(m->relationship);
        if (std::find(seen.begin(), seen.end(), n) != seen.end()) continue;
        seen.push_back(n);
        if (!out.empty()) out += ", ";
        out.append(n.data(), n.size());
    }
    return out;
}

} // namespace

std::optional<Relationship> co_residuary(Relationship male) {
    switch (male) {
        case R::Son:                return R::Daughter;
        case R::Grandson:           return R::Granddaughter;
        case R::FullBrother:        return R::FullSister;
        case R::ConsanguineBrother: return R::ConsanguineSister;
        default:                    return std::nullopt;
    }
}

std::optional<Relationship> select_residuary_group(const RosterFacts& active) {
    for (Relationship r : kResiduaryPriority) {
        if (active.has(r)) return r;
    }
    return std::nullopt;
}

Adjustment distribute_and_adjust(std::vector<HeirAllocation>& shares, const RosterFacts& active) {
    Adjustment adj;

    Fraction fixed_total;
    for (const auto& s : shares) fixed_total += s.fixed;

    const Fraction base(kBaseParts);
    const Fraction residue = base - fixed_total;

    // -------------------------
    // Asabah
    // -------------------------
    adj.residuary_group = select_residuary_group(active);
    if (adj.residuary_group) {
        const Relationship group = *adj.residuary_group;
        const auto partner = co_residuary(group);

        std::vector<HeirAllocation*> members;
        for (auto& s : shares) {
            if (s.relationship == group || (partner && s.relationship == *partner)) members.push_back(&s);
        }

        if (residue.is_positive()) {
            const auto parts = split_pool(residue, members, [](const HeirAllocation* a) {
                return is_male(a->relationship) ? 2 : 1;
            });
            for (std::size_t k = 0; k < members.size(); ++k) {
                members[k]->residue = parts[k];
                members[k]->residuary = true;
            }
            adj.notes.push_back("Residue of " + parts_text(residue) + " goes to " + category_list(members) +
                                " as residuary (asabah)");
        } else {
            adj.notes.push_back("No residue remains for " + category_list(members) +
                                ": fixed shares take the whole estate");
        }
    }

    Fraction total;
    for (const auto& s : shares) total += s.total();
    adj.total = total;

    // -------------------------
    // Awl
    // -------------------------
    if (total > base) {
        adj.case_tag = CaseTag::Awl;
        adj.base = total;
        adj.notes.push_back("Awl: fixed shares total " + parts_text(total) + " of 24; base raised to " +
                            total.to_string() + " and every share reduced proportionally");
        return adj;
    }

    if (total == base) return adj;

    if (total.is_zero()) {
        adj.notes.push_back("No eligible heirs: the estate is not distributed");
        return adj;
    }

    // -------------------------
    // Radd
    // -------------------------
    const Fraction shortfall = base - total;

    std::vector<HeirAllocation*> eligible;
    for (auto& s : shares) {
        if (!is_spouse(s.relationship) && s.fixed.is_positive()) eligible.push_back(&s);
    }

    bool to_spouse = false;
    if (eligible.empty()) {
        for (auto& s : shares) {
            if (is_spouse(s.relationship) && s.fixed.is_positive()) eligible.push_back(&s);
        }
        to_spouse = true;
    }

    const auto returned = split_pool(shortfall, eligible, [](const HeirAllocation* a) { return a->fixed; });
    for (std::size_t k = 0; k < eligible.size(); ++k) eligible[k]->radd = returned[k];

    adj.case_tag = CaseTag::Radd;
    adj.total = base;
    if (to_spouse) {
        adj.notes.push_back("Radd: no blood relative holds a fixed share; " + parts_text(shortfall) +
                            " returned to " + category_list(eligible));
    } else {
        adj.notes.push_back("Radd: " + parts_text(shortfall) + " returned to " + category_list(eligible) +
                            " in proportion to their shares (spouses excluded)");
    }
    return adj;
}

} // namespace faraid
