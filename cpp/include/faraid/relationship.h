// faraid/cpp/include/faraid/relationship.h
#pragma once
#include <array>
#include <cstddef>
#include <string_view>

namespace faraid {

// Closed set of canonical relationships. Every stage switches over it exhaustively,
// so a new category must be handled everywhere before the build is clean again.
enum class Relationship {
    Husband,
    Wife,
    Father,
    Mother,
    Son,
    Daughter,
    Grandson,
    Granddaughter,
    Grandfather,
    Grandmother,
    FullBrother,
    FullSister,
    ConsanguineBrother,
    ConsanguineSister,
    UterineBrother,
    UterineSister,
    FullNephew,
    Excluded, // barred relations, distant kindred, unmapped labels
};

constexpr std::size_t kRelationshipCount = static_cast<std::size_t>(Relationship::Excluded) + 1;

constexpr std::array<Relationship, kRelationshipCount> kAllRelationships{
    Relationship::Husband,           Relationship::Wife,
    Relationship::Father,            Relationship::Mother,
    Relationship::Son,               Relationship::Daughter,
    Relationship::Grandson,          Relationship::Granddaughter,
    Relationship::Grandfather,       Relationship::Grandmother,
    Relationship::FullBrother,       Relationship::FullSister,
    Relationship::ConsanguineBrother, Relationship::ConsanguineSister,
    Relationship::UterineBrother,    Relationship::UterineSister,
    Relationship::FullNephew,        Relationship::Excluded,
};

enum class Gender { Unknown, Male, Female };

constexpr std::size_t index_of(Relationship r) { return static_cast<std::size_t>(r); }

// Display name, e.g. "ConsanguineSister".
std::string_view to_string(Relationship r);
std::string_view to_string(Gender g);

bool is_male(Relationship r);
bool is_spouse(Relationship r);
bool is_sibling(Relationship r);     // full, consanguine and uterine, both sexes

} // namespace faraid
