#include "faraid/relationship.h"

namespace faraid {

std::string_view to_string(Relationship r) {
    switch (r) {
        case Relationship::Husband:            return "Husband";
        case Relationship::Wife:               return "Wife";
        case Relationship::Father:             return "Father";
        case Relationship::Mother:             return "Mother";
        case Relationship::Son:                return "Son";
        case Relationship::Daughter:           return "Daughter";
        case Relationship::Grandson:           return "Grandson";
        case Relationship::Granddaughter:      return "Granddaughter";
        case Relationship::Grandfather:        return "Grandfather";
        case Relationship::Grandmother:        return "Grandmother";
        case Relationship::FullBrother:        return "FullBrother";
        case Relationship::FullSister:         return "FullSister";
        case Relationship::ConsanguineBrother: return "ConsanguineBrother";
        case Relationship::ConsanguineSister:  return "ConsanguineSister";
        case Relationship::UterineBrother:     return "UterineBrother";
        case Relationship::UterineSister:      return "UterineSister";
        case Relationship::FullNephew:         return "FullNephew";
        case Relationship::Excluded:           return "Excluded";
    }
    return "Excluded";
}

std::string_view to_string(Gender g) {
    switch (g) {
        case Gender::Male:    return "Male";
        case Gender::Female:  return "Female";
        case Gender::Unknown: return "Unknown";
    }
    return "Unknown";
}

bool is_male(Relationship r) {
    switch (r) {
        case Relationship::Husband:
        case Relationship::Father:
        case Relationship::Son:
        case Relationship::Grandson:
        case Relationship::Grandfather:
        case Relationship::FullBrother:
        case Relationship::ConsanguineBrother:
        case Relationship::UterineBrother:
        case Relationship::FullNephew:
            return true;
        case Relationship::Wife:
        case Relationship::Mother:
        case Relationship::Daughter:
        case Relationship::Granddaughter:
        case Relationship::Grandmother:
        case Relationship::FullSister:
        case Relationship::ConsanguineSister:
        case Relationship::UterineSister:
        case Relationship::Excluded:
            return false;
    }
    return false;
}

bool is_spouse(Relationship r) {
    return r == Relationship::Husband || r == Relationship::Wife;
}

bool is_sibling(Relationship r) {
    switch (r) {
        case Relationship::FullBrother:
        case Relationship::FullSister:
        case Relationship::ConsanguineBrother:
        case Relationship::ConsanguineSister:
        case Relationship::UterineBrother:
        case Relationship::UterineSister:
            return true;
        default:
            return false;
    }
}

} // namespace faraid
