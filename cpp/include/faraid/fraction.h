// faraid/cpp/include/faraid/fraction.h
#pragma once
#include <cstdint>
#include <string>

namespace faraid {

// Exact rational number, always kept normalized: den > 0, gcd(|num|, den) == 1.
// All arithmetic is checked; overflow throws FaraidException(ErrorCode::Overflow).
class Fraction {
public:
    Fraction() = default;
    Fraction(int64_t n); // NOLINT: implicit from integer parts is intended
    Fraction(int64_t n, int64_t d);

    int64_t num() const { return num_; }
    int64_t den() const { return den_; }

    bool is_zero() const { return num_ == 0; }
    bool is_positive() const { return num_ > 0; }
    bool is_integer() const { return den_ == 1; }

    double to_double() const;

    // "17", "3/2", "-1/4"
    std::string to_string() const;

    // round(v * scale) / scale, e.g. 1.5 -> 3/2
    static Fraction from_decimal(double v, int64_t scale = 1000);

    Fraction& operator+=(const Fraction& o);
    Fraction& operator-=(const Fraction& o);
    Fraction& operator*=(const Fraction& o);
    Fraction& operator/=(const Fraction& o);

    friend Fraction operator+(Fraction a, const Fraction& b) { return a += b; }
    friend Fraction operator-(Fraction a, const Fraction& b) { return a -= b; }
    friend Fraction operator*(Fraction a, const Fraction& b) { return a *= b; }
    friend Fraction operator/(Fraction a, const Fraction& b) { return a /= b; }

    friend bool operator==(const Fraction& a, const Fraction& b) {
        return a.num_ == b.num_ && a.den_ == b.den_;
    }
    friend bool operator!=(const Fraction& a, const Fraction& b) { return !(a == b); }
    friend bool operator<(const Fraction& a, const Fraction& b);
    friend bool operator>(const Fraction& a, const Fraction& b) { return b < a; }
    friend bool operator<=(const Fraction& a, const Fraction& b) { return !(b < a); }
    friend bool operator>=(const Fraction& a, const Fraction& b) { return !(a < b); }

private:
    void normalize();

    int64_t num_{0};
    int64_t den_{1};
};

} // namespace faraid
