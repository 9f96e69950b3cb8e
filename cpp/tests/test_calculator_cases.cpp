#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "faraid/calculator.h"
#include "faraid/errors.h"
#include "faraid/validator.h"

using faraid::CaseTag;
using faraid::Fraction;
using faraid::Relationship;

struct H {
    const char* id;
    const char* rel;
    const char* gender;
    const char* group;
};

static faraid::EstateInput make(double amount, const std::vector<H>& hs) {
    faraid::EstateInput in;
    in.estate_amount = amount;
    for (const auto& h : hs) {
        faraid::Heir x;
        x.id = h.id;
        x.name = std::string("Name ") + h.id;
        x.relationship = h.rel;
        x.gender = h.gender;
        x.heir_group = h.group;
        in.heirs.push_back(x);
    }
    return in;
}

static const faraid::ShareResult& by_id(const faraid::CalculationResult& r, const std::string& id) {
    for (const auto& s : r.heirs) {
        if (s.heir_id == id) return s;
    }
    std::cerr << "missing heir " << id << "\n";
    assert(false);
    return r.heirs.front();
}

static bool approx(double a, double b) { return std::fabs(a - b) < 1e-6; }

static void test_single_son() {
    auto r = faraid::calculate(make(1000.0, {{"s", "Son", "", ""}}));
    assert(r.case_tag == CaseTag::Standard);
    assert(r.base_number == Fraction(24));
    assert(r.total_parts == Fraction(24));
    assert(by_id(r, "s").parts == Fraction(24));
    assert(by_id(r, "s").share_label == "Residue");
    assert(approx(by_id(r, "s").share_amount, 1000.0));
    assert(approx(by_id(r, "s").percentage, 100.0));
}

static void test_husband_daughter_radd() {
    auto r = faraid::calculate(make(240.0, {{"h", "Husband", "", ""}, {"d", "Daughter", "", ""}}));
    assert(r.case_tag == CaseTag::Radd);
    assert(by_id(r, "h").parts == Fraction(6));
    assert(by_id(r, "h").share_label == "1/4");
    assert(by_id(r, "d").parts == Fraction(18));
    assert(by_id(r, "d").share_label == "1/2 + Radd");
    assert(approx(by_id(r, "h").share_amount, 60.0));
    assert(approx(by_id(r, "d").share_amount, 180.0));
}

static void test_wives_son_father() {
    auto r = faraid::calculate(make(2400000.0, {
        {"w1", "Spouse", "", "Wives"},
        {"w2", "Spouse", "", "Wives"},
        {"s", "Child", "", "Sons"},
        {"f", "Father", "", ""},
    }));
    assert(r.case_tag == CaseTag::Standard);
    assert(by_id(r, "w1").relationship == Relationship::Wife);
    assert(by_id(r, "w1").parts == Fraction(3, 2));
    assert(by_id(r, "w2").parts == Fraction(3, 2));
    assert(by_id(r, "w1").share_label == "1/8 shared");
    assert(by_id(r, "f").parts == Fraction(4));
    assert(by_id(r, "s").parts == Fraction(17));

    assert(approx(by_id(r, "w1").share_amount, 150000.0));
    assert(approx(by_id(r, "w2").share_amount, 150000.0));
    assert(approx(by_id(r, "f").share_amount, 400000.0));
    assert(approx(by_id(r, "s").share_amount, 1700000.0));

    const auto& wives = r.group_summary.at("Wives");
    assert(wives.count == 2);
    assert(approx(wives.total_share, 300000.0));
    assert(wives.total_parts == Fraction(3));
    // no heir group -> keyed by relationship
    assert(r.group_summary.count("Father") == 1);
}

static void test_awl() {
    auto r = faraid::calculate(make(700.0, {
        {"h", "Husband", "", ""},
        {"s1", "Full Sister", "", ""},
        {"s2", "Full Sister", "", ""},
    }));
    assert(r.case_tag == CaseTag::Awl);
    assert(r.base_number == Fraction(28));
    assert(r.total_parts == Fraction(28));
    assert(by_id(r, "h").parts == Fraction(12));
    assert(approx(by_id(r, "h").share_amount, 300.0));
    assert(approx(by_id(r, "s1").share_amount, 200.0));
    assert(approx(by_id(r, "s2").share_amount, 200.0));
}

static void test_exclusions_in_result() {
    auto r = faraid::calculate(make(100.0, {
        {"s", "Son", "", ""},
        {"b", "Brother", "", ""},
        {"st", "Stepson", "", ""},
        {"x", "Neighbour", "", ""},
    }));
    const auto& b = by_id(r, "b");
    assert(b.excluded);
    assert(b.parts.is_zero());
    assert(b.share_amount == 0.0);
    assert(b.share_label == "Excluded");
    assert(b.exclusion_reason == "blocked by Son");

    assert(by_id(r, "st").excluded);
    assert(by_id(r, "x").excluded);
    assert(r.unmapped.size() == 1 && r.unmapped[0] == "x");
    assert(approx(by_id(r, "s").share_amount, 100.0));

    // roster order preserved
    assert(r.heirs[0].heir_id == "s" && r.heirs[3].heir_id == "x");

    bool strict_thrown = false;
    faraid::CalcOptions strict;
    strict.strict_unmapped = true;
    try {
        (void)faraid::calculate(make(100.0, {{"s", "Son", "", ""}, {"x", "Neighbour", "", ""}}), strict);
    } catch (const faraid::FaraidException& e) {
        strict_thrown = (e.code() == faraid::ErrorCode::UnmappedRelationship);
    }
    assert(strict_thrown);
}

static void test_sister_with_daughter_gets_nothing() {
    auto r = faraid::calculate(make(100.0, {{"d", "Daughter", "", ""}, {"fs", "Full Sister", "", ""}}));
    assert(by_id(r, "fs").excluded);
    assert(by_id(r, "d").parts == Fraction(24));
    assert(r.case_tag == CaseTag::Radd);

    // the surplus goes back by Radd, the estate is not exhausted
    const std::string& why = by_id(r, "fs").exclusion_reason;
    assert(why.find("Radd") != std::string::npos);
    assert(why.find("nothing remains") == std::string::npos);
    bool noted = false;
    for (const auto& n : r.notes) {
        if (n.find("receives nothing") == std::string::npos) continue;
        assert(n.find("Radd") != std::string::npos);
        assert(n.find("exhausted") == std::string::npos);
        noted = true;
    }
    assert(noted);

    // a closer residuary takes the residue
    auto g = faraid::calculate(make(100.0, {{"gf", "Paternal Grandfather", "", ""}, {"b", "Brother", "", ""}}));
    assert(g.case_tag == CaseTag::Standard);
    assert(by_id(g, "gf").parts == Fraction(24));
    assert(by_id(g, "b").excluded);
    assert(by_id(g, "b").exclusion_reason == "the residue goes to the closer residuary Grandfather");

    // fixed shares consume the whole estate
    auto full = faraid::calculate(make(100.0, {
        {"h", "Husband", "", ""},
        {"m", "Mother", "", ""},
        {"u1", "Maternal Half Brother", "", ""},
        {"u2", "Maternal Half Sister", "", ""},
        {"b", "Brother", "", ""},
    }));
    assert(full.case_tag == CaseTag::Standard);
    assert(by_id(full, "b").excluded);
    assert(by_id(full, "b").exclusion_reason == "nothing remains after the shares of closer heirs");
}

static void test_mother_sibling_basis() {
    auto in = make(120.0, {
        {"m", "Mother", "", ""},
        {"f", "Father", "", ""},
        {"b1", "Brother", "", ""},
        {"b2", "Brother", "", ""},
    });

    auto roster = faraid::calculate(in);
    assert(by_id(roster, "m").parts == Fraction(4));
    assert(by_id(roster, "f").parts == Fraction(20));

    faraid::CalcOptions opt;
    opt.mother_sibling_basis = faraid::SiblingBasis::ActiveOnly;
    auto active = faraid::calculate(in, opt);
    assert(by_id(active, "m").parts == Fraction(8));
    assert(by_id(active, "f").parts == Fraction(16));
}

static void test_degenerate_inputs() {
    auto empty = faraid::calculate(make(500.0, {}));
    assert(empty.heirs.empty());
    assert(empty.base_number == Fraction(24));
    assert(empty.total_parts.is_zero());
    assert(!empty.notes.empty());

    auto zero = faraid::calculate(make(0.0, {{"s", "Son", "", ""}}));
    assert(zero.heirs.empty());
    assert(zero.total_parts.is_zero());
    assert(!zero.notes.empty());

    auto barred = faraid::calculate(make(100.0, {{"a", "Adopted Son", "", ""}, {"n", "Niece", "", ""}}));
    assert(barred.heirs.size() == 2);
    assert(barred.heirs[0].excluded && barred.heirs[1].excluded);
    assert(barred.total_parts.is_zero());
    assert(!barred.notes.empty());
}

static void test_invalid_inputs() {
    auto expect_invalid = [](const faraid::EstateInput& in) {
        bool thrown = false;
        try {
            (void)faraid::calculate(in);
        } catch (const faraid::FaraidException& e) {
            thrown = (e.code() == faraid::ErrorCode::InvalidArgs);
        }
        assert(thrown);
    };

    expect_invalid(make(-1.0, {{"s", "Son", "", ""}}));
    expect_invalid(make(std::nan(""), {{"s", "Son", "", ""}}));
    expect_invalid(make(10.0, {{"s", "Son", "", ""}, {"s", "Daughter", "", ""}}));
    expect_invalid(make(10.0, {{"", "Son", "", ""}}));
}

static void test_rounding_and_idempotence() {
    auto in = make(100.0, {{"d1", "Daughter", "", ""}, {"d2", "Daughter", "", ""}, {"d3", "Daughter", "", ""}});
    auto r = faraid::calculate(in);
    double total = 0.0;
    for (const auto& s : r.heirs) total += s.share_amount;
    assert(approx(total, 100.0));
    assert(approx(by_id(r, "d1").share_amount, 33.34));
    assert(approx(by_id(r, "d2").share_amount, 33.33));

    auto again = faraid::calculate(in);
    assert(faraid::to_json(r).dump() == faraid::to_json(again).dump());

    faraid::CalcOptions whole;
    whole.currency_decimals = 0;
    auto w = faraid::calculate(in, whole);
    assert(approx(by_id(w, "d1").share_amount, 34.0));
    assert(approx(by_id(w, "d3").share_amount, 33.0));

    auto vr = faraid::validate_result(in, r);
    assert(vr.ok);
}

static void test_json_shape() {
    auto r = faraid::calculate(make(240.0, {{"h", "Husband", "", ""}, {"d", "Daughter", "", ""}}));
    auto j = faraid::to_json(r);
    assert(j["case"] == "Radd");
    assert(j["baseNumber"].get<double>() == 24.0);
    assert(j["heirs"].size() == 2);
    assert(j["heirs"][0]["id"] == "h");
    assert(j["heirs"][0]["relationship"] == "Husband");
    assert(j["heirs"][1]["partsExact"] == "18");
    assert(j["groupSummary"].contains("Daughter"));
}

int main() {
    test_single_son();
    test_husband_daughter_radd();
    test_wives_son_father();
    test_awl();
    test_exclusions_in_result();
    test_sister_with_daughter_gets_nothing();
    test_mother_sibling_basis();
    test_degenerate_inputs();
    test_invalid_inputs();
    test_rounding_and_idempotence();
    test_json_shape();

    std::cout << "OK\n";
    return 0;
}
