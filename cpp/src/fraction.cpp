#include "faraid/fraction.h"
#include "faraid/errors.h"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace faraid {

namespace {

constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

[[noreturn]] void overflow(const char* op) {
    throw FaraidException(ErrorCode::Overflow, std::string("fraction overflow in ") + op);
}

int64_t checked_mul(int64_t a, int64_t b) {
    if (a == 0 || b == 0) return 0;
    if (a > 0) {
        if (b > 0) { if (a > kMax / b) overflow("mul"); }
        else       { if (b < kMin / a) overflow("mul"); }
    } else {
        if (b > 0) { if (a < kMin / b) overflow("mul"); }
        else       { if (a < kMax / b) overflow("mul"); }
    }
    return a * b;
}

int64_t checked_add(int64_t a, int64_t b) {
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) overflow("add");
    return a + b;
}

int64_t abs64(int64_t v) {
    if (v == kMin) overflow("abs");
    return v < 0 ? -v : v;
}

} // namespace

Fraction::Fraction(int64_t n) : num_(n), den_(1) {}

Fraction::Fraction(int64_t n, int64_t d) : num_(n), den_(d) {
    if (d == 0) throw FaraidException(ErrorCode::InvalidArgs, "fraction with zero denominator");
    normalize();
}

void Fraction::normalize() {
    if (den_ < 0) {
        if (den_ == kMin || num_ == kMin) overflow("normalize");
        den_ = -den_;
        num_ = -num_;
    }
    if (num_ == 0) {
        den_ = 1;
        return;
    }
    const int64_t g = std::gcd(abs64(num_), den_);
    if (g > 1) {
        num_ /= g;
        den_ /= g;
    }
}

double Fraction::to_double() const {
    return static_cast<double>(num_) / static_cast<double>(den_);
}

std::string Fraction::to_string() const {
    if (den_ == 1) return std::to_string(num_);
    return std::to_string(num_) + "/" + std::to_string(den_);
}

Fraction Fraction::from_decimal(double v, int64_t scale) {
    if (!std::isfinite(v)) throw FaraidException(ErrorCode::InvalidArgs, "non-finite decimal value");
    if (scale <= 0) throw FaraidException(ErrorCode::InvalidArgs, "decimal scale must be positive");
    const long double scaled = static_cast<long double>(v) * static_cast<long double>(scale);
    if (std::fabs(scaled) >= 9.0e18L) overflow("from_decimal");
    return Fraction(static_cast<int64_t>(std::llround(scaled)), scale);
}

Fraction& Fraction::operator+=(const Fraction& o) {
    const int64_t g = std::gcd(den_, o.den_);
    const int64_t lhs = checked_mul(num_, o.den_ / g);
    const int64_t rhs = checked_mul(o.num_, den_ / g);
    num_ = checked_add(lhs, rhs);
    den_ = checked_mul(den_ / g, o.den_);
    normalize();
    return *this;
}

Fraction& Fraction::operator-=(const Fraction& o) {
    if (o.num_ == kMin) overflow("sub");
    Fraction neg;
    neg.num_ = -o.num_;
    neg.den_ = o.den_;
    return *this += neg;
}

Fraction& Fraction::operator*=(const Fraction& o) {
    // cross-reduce first to keep intermediates small
    const int64_t g1 = std::gcd(abs64(num_), o.den_);
    const int64_t g2 = std::gcd(abs64(o.num_), den_);
    num_ = checked_mul(num_ / g1, o.num_ / g2);
    den_ = checked_mul(den_ / g2, o.den_ / g1);
    normalize();
    return *this;
}

Fraction& Fraction::operator/=(const Fraction& o) {
    if (o.num_ == 0) throw FaraidException(ErrorCode::InvalidArgs, "fraction division by zero");
    Fraction inv;
    inv.num_ = o.den_;
    inv.den_ = o.num_;
    inv.normalize();
    return *this *= inv;
}

bool operator<(const Fraction& a, const Fraction& b) {
    if (a.den_ == b.den_) return a.num_ < b.num_;
    return checked_mul(a.num_, b.den_) < checked_mul(b.num_, a.den_);
}

} // namespace faraid
