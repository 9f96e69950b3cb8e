// faraid/cpp/include/faraid/normalizer.h
#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "faraid/heir.h"
#include "faraid/relationship.h"

namespace faraid {

struct Classification {
    Relationship relationship{Relationship::Excluded};
    Gender gender{Gender::Unknown};
    bool unmapped{false}; // label not understood (as opposed to a recognized barred relation)
    std::string reason;   // set whenever relationship == Excluded
};

struct NormalizedHeir {
    Heir heir;
    Relationship relationship{Relationship::Excluded};
    Gender gender{Gender::Unknown};
    bool unmapped{false};
    std::string reason;
};

Gender parse_gender(std::string_view raw);

// Gender implied by a heir-group label ("Sons" -> Male, "Wives" -> Female), Unknown otherwise.
Gender gender_from_group(std::string_view group);

// Single-record relabeling: raw relationship, with gender and heir group as
// disambiguators for generic labels ("Child", "Spouse", "Sibling", ...).
Classification classify_heir(const Heir& h);

std::vector<NormalizedHeir> normalize_roster(const std::vector<Heir>& heirs);

struct AuditEntry {
    std::string id;
    std::string raw;
    Relationship canonical{Relationship::Excluded};
    Gender gender{Gender::Unknown}; // resolved side, from the gender field or the heir group
    bool unmapped{false};
    std::string reason;
};

std::vector<AuditEntry> audit_roster(const std::vector<Heir>& heirs);

} // namespace faraid
