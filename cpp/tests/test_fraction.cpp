#include <cassert>
#include <iostream>
#include <limits>

#include "faraid/errors.h"
#include "faraid/fraction.h"
#include "faraid/allocation.h"

using faraid::Fraction;

static void test_normalization() {
    Fraction a(6, 24);
    assert(a.num() == 1 && a.den() == 4);
    assert(a.to_string() == "1/4");

    Fraction b(3, -6);
    assert(b.num() == -1 && b.den() == 2);
    assert(b.to_string() == "-1/2");

    Fraction z(0, 7);
    assert(z.is_zero() && z.den() == 1);
    assert(Fraction(17).to_string() == "17");
    assert(Fraction(34, 2).is_integer());
}

static void test_arithmetic() {
    assert(Fraction(1, 2) + Fraction(1, 3) == Fraction(5, 6));
    assert(Fraction(1, 2) - Fraction(2, 3) == Fraction(-1, 6));
    assert(Fraction(3, 2) * Fraction(2, 3) == Fraction(1));
    assert(Fraction(3) / Fraction(24) == Fraction(1, 8));
    assert(Fraction(1, 8) < Fraction(1, 6));
    assert(Fraction(28) > Fraction(24));
    assert(Fraction(2, 3) >= Fraction(16, 24));

    // 1/2 + 1/3 + 1/6 closes exactly
    Fraction sum = Fraction(1, 2);
    sum += Fraction(1, 3);
    sum += Fraction(1, 6);
    assert(sum == Fraction(1));

    assert(Fraction::from_decimal(1.5) == Fraction(3, 2));
    assert(Fraction::from_decimal(0.125) == Fraction(1, 8));
    assert(Fraction(3, 2).to_double() == 1.5);
}

static void test_errors() {
    bool thrown = false;
    try {
        Fraction bad(1, 0);
        (void)bad;
    } catch (const faraid::FaraidException& e) {
        thrown = (e.code() == faraid::ErrorCode::InvalidArgs);
    }
    assert(thrown);

    thrown = false;
    try {
        Fraction big(std::numeric_limits<int64_t>::max() / 2 + 1);
        big += big;
    } catch (const faraid::FaraidException& e) {
        thrown = (e.code() == faraid::ErrorCode::Overflow);
    }
    assert(thrown);

    thrown = false;
    try {
        Fraction x(1);
        x /= Fraction(0);
    } catch (const faraid::FaraidException&) {
        thrown = true;
    }
    assert(thrown);
}

static void test_allocation() {
    // residue of 21 parts between 7 sons (x2) and 7 daughters (x1)
    std::vector<int> weights;
    for (int i = 0; i < 7; ++i) weights.push_back(2);
    for (int i = 0; i < 7; ++i) weights.push_back(1);
    auto parts = faraid::split_pool(Fraction(21), weights, [](int w) { return w; });
    assert(parts.size() == 14);
    assert(parts[0] == Fraction(2));
    assert(parts[13] == Fraction(1));

    auto none = faraid::allocate_by_weights(Fraction(5), {Fraction(0), Fraction(0)});
    assert(none[0].is_zero() && none[1].is_zero());

    // 100 units in thirds: 34 / 33 / 33, ties broken by position
    auto units = faraid::apportion_units(100, {Fraction(1, 3), Fraction(1, 3), Fraction(1, 3)});
    assert(units[0] == 34 && units[1] == 33 && units[2] == 33);

    // exact split needs no rounding
    auto exact = faraid::apportion_units(240000000, {Fraction(1, 16), Fraction(1, 16), Fraction(1, 6), Fraction(17, 24)});
    assert(exact[0] == 15000000 && exact[1] == 15000000);
    assert(exact[2] == 40000000 && exact[3] == 170000000);

    auto zeros = faraid::apportion_units(0, {Fraction(1)});
    assert(zeros[0] == 0);
}

int main() {
    test_normalization();
    test_arithmetic();
    test_errors();
    test_allocation();

    std::cout << "OK\n";
    return 0;
}
