// faraid/cpp/include/faraid/asabah.h
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "faraid/fraction.h"
#include "faraid/furud.h"
#include "faraid/result.h"
#include "faraid/roster.h"

namespace faraid {

// Residuary categories in descending priority. Each is a male heir type; its
// female counterpart (if any) joins the group as co-residuary.
constexpr Relationship kResiduaryPriority[] = {
    Relationship::Son,
    Relationship::Grandson,
    Relationship::Father,
    Relationship::Grandfather,
    Relationship::FullBrother,
    Relationship::ConsanguineBrother,
    Relationship::FullNephew,
};

// Daughter for Son, FullSister for FullBrother, ...; nullopt for Father, Grandfather, FullNephew.
std::optional<Relationship> co_residuary(Relationship male);

// First priority category with at least one active member.
std::optional<Relationship> select_residuary_group(const RosterFacts& active);

struct Adjustment {
    Fraction base{kBaseParts};
    Fraction total;
    CaseTag case_tag{CaseTag::Standard};
    std::optional<Relationship> residuary_group;
    std::vector<std::string> notes;
};

// Asabah, then Awl or Radd. Fills residue / radd of `shares` in place.
Adjustment distribute_and_adjust(std::vector<HeirAllocation>& shares, const RosterFacts& active);

} // namespace faraid
