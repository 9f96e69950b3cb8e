#include <cassert>
#include <iostream>
#include <string>

#include "faraid/normalizer.h"

using faraid::Gender;
using faraid::Relationship;

static faraid::Classification classify(const std::string& rel, const std::string& gender = "",
                                       const std::string& group = "") {
    faraid::Heir h;
    h.id = "x";
    h.name = "X";
    h.relationship = rel;
    h.gender = gender;
    h.heir_group = group;
    return faraid::classify_heir(h);
}

static void test_canonical_labels() {
    assert(classify("Husband").relationship == Relationship::Husband);
    assert(classify("wife").relationship == Relationship::Wife);
    assert(classify("Wife 2").relationship == Relationship::Wife);
    assert(classify("  MOTHER ").relationship == Relationship::Mother);
    assert(classify("Son's Son").relationship == Relationship::Grandson);
    assert(classify("Son\xE2\x80\x99s Daughter").relationship == Relationship::Granddaughter);
    assert(classify("Paternal Grandfather").relationship == Relationship::Grandfather);
    assert(classify("Maternal Grandmother").relationship == Relationship::Grandmother);
    assert(classify("Full Sisters").relationship == Relationship::FullSister);
    assert(classify("Paternal Half-Brother").relationship == Relationship::ConsanguineBrother);
    assert(classify("Maternal Half Sister").relationship == Relationship::UterineSister);
    assert(classify("Brother's Son").relationship == Relationship::FullNephew);
}

static void test_generic_labels() {
    auto son = classify("Child", "", "Sons");
    assert(son.relationship == Relationship::Son);
    assert(son.gender == Gender::Male);
    assert(!son.unmapped);

    assert(classify("Child", "", "Daughters").relationship == Relationship::Daughter);
    assert(classify("Spouse", "Male").relationship == Relationship::Husband);
    assert(classify("Spouse", "", "Wives").relationship == Relationship::Wife);
    assert(classify("Sibling", "f").relationship == Relationship::FullSister);
    assert(classify("Parent", "male").relationship == Relationship::Father);

    // explicit gender wins over the group
    assert(classify("Child", "Female", "Sons").relationship == Relationship::Daughter);

    // no way to pick a side
    auto amb = classify("Child");
    assert(amb.relationship == Relationship::Excluded);
    assert(amb.unmapped);
    assert(!amb.reason.empty());
}

static void test_barred_and_distant() {
    auto step = classify("Stepson");
    assert(step.relationship == Relationship::Excluded);
    assert(!step.unmapped);
    assert(step.reason.find("step") != std::string::npos);

    assert(classify("Step Mother").relationship == Relationship::Excluded);
    assert(classify("Adopted Son").relationship == Relationship::Excluded);
    assert(classify("Foster Daughter").relationship == Relationship::Excluded);
    assert(classify("Illegitimate Child", "Male").relationship == Relationship::Excluded);
    assert(classify("Son-in-law").relationship == Relationship::Excluded);

    auto mgf = classify("Maternal Grandfather");
    assert(mgf.relationship == Relationship::Excluded);
    assert(!mgf.unmapped);
    assert(mgf.reason.find("distant kindred") != std::string::npos);

    assert(classify("Daughter's Son").relationship == Relationship::Excluded);
    assert(classify("Sister's Daughter").relationship == Relationship::Excluded);
    assert(classify("Paternal Aunt").relationship == Relationship::Excluded);
    assert(classify("Niece").relationship == Relationship::Excluded);
}

static void test_unmapped() {
    auto c = classify("Business Partner");
    assert(c.relationship == Relationship::Excluded);
    assert(c.unmapped);

    auto e = classify("");
    assert(e.relationship == Relationship::Excluded);
    assert(e.unmapped);
}

static void test_roster_and_audit() {
    std::vector<faraid::Heir> heirs(3);
    heirs[0].id = "a"; heirs[0].relationship = "Spouse"; heirs[0].heir_group = "Wives";
    heirs[1].id = "b"; heirs[1].relationship = "Cousin";
    heirs[2].id = "c"; heirs[2].relationship = "Child"; heirs[2].gender = "M";

    auto n = faraid::normalize_roster(heirs);
    assert(n.size() == 3);
    assert(n[0].relationship == Relationship::Wife);
    assert(n[1].relationship == Relationship::Excluded && n[1].unmapped);
    assert(n[2].relationship == Relationship::Son);
    assert(n[2].heir.id == "c");

    auto audit = faraid::audit_roster(heirs);
    assert(audit.size() == 3);
    assert(audit[1].id == "b");
    assert(audit[1].raw == "Cousin");
    assert(audit[1].unmapped);
    assert(audit[0].canonical == Relationship::Wife);
    assert(audit[0].gender == Gender::Female);
}

int main() {
    assert(faraid::parse_gender("Male") == Gender::Male);
    assert(faraid::parse_gender(" f ") == Gender::Female);
    assert(faraid::parse_gender("other") == Gender::Unknown);
    assert(faraid::gender_from_group("Sons") == Gender::Male);
    assert(faraid::gender_from_group("Wives") == Gender::Female);
    assert(faraid::gender_from_group("Sons and Daughters") == Gender::Unknown);

    test_canonical_labels();
    test_generic_labels();
    test_barred_and_distant();
    test_unmapped();
    test_roster_and_audit();

    std::cout << "OK\n";
    return 0;
}
