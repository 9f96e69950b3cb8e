#include "faraid/allocation.h"
#include "faraid/errors.h"

#include <algorithm>
#include <numeric>

namespace faraid {

namespace {

// floor for non-negative fractions
int64_t floor_nonneg(const Fraction& f) {
    return f.num() / f.den();
}

} // namespace

std::vector<Fraction> allocate_by_weights(const Fraction& pool, const std::vector<Fraction>& weights) {
    std::vector<Fraction> out(weights.size(), Fraction(0));

    Fraction total(0);
    for (const auto& w : weights) {
        if (w < Fraction(0)) throw FaraidException(ErrorCode::InvalidArgs, "negative allocation weight");
        total += w;
    }
    if (total.is_zero()) return out;

    for (size_t i = 0; i < weights.size(); ++i) {
        out[i] = pool * weights[i] / total;
    }
    return out;
}

std::vector<int64_t> apportion_units(int64_t total_units, const std::vector<Fraction>& shares) {
    std::vector<int64_t> out(shares.size(), 0);
    if (total_units <= 0 || shares.empty()) return out;

    std::vector<Fraction> rem(shares.size(), Fraction(0));
    Fraction exact_sum(0);
    int64_t floor_sum = 0;

    for (size_t i = 0; i < shares.size(); ++i) {
        if (shares[i] < Fraction(0)) throw FaraidException(ErrorCode::InvalidArgs, "negative share");
        const Fraction exact = Fraction(total_units) * shares[i];
        const int64_t fl = floor_nonneg(exact);
        out[i] = fl;
        rem[i] = exact - Fraction(fl);
        exact_sum += exact;
        floor_sum += fl;
    }

    // round half up
    const int64_t target = floor_nonneg(exact_sum + Fraction(1, 2));
    int64_t leftover = target - floor_sum;
    if (leftover <= 0) return out;

    std::vector<size_t> order(shares.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return rem[a] > rem[b];
    });

    for (size_t k = 0; k < order.size() && leftover > 0; ++k) {
        if (rem[order[k]].is_zero()) break;
        ++out[order[k]];
        --leftover;
    }
    return out;
}

} // namespace faraid
