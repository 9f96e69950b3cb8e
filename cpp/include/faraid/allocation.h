// faraid/cpp/include/faraid/allocation.h
#pragma once
#include <cstdint>
#include <vector>

#include "faraid/fraction.h"

namespace faraid {

// Split `pool` among weights proportionally. All-zero weights yield all-zero shares.
// Shares always sum to `pool` exactly when any weight is positive.
std::vector<Fraction> allocate_by_weights(const Fraction& pool, const std::vector<Fraction>& weights);

// Divide a pool among a set of members by a weight function.
// Equal split: weight returns 1. Asabah: 2 for males, 1 for females.
template <class T, class WeightFn>
std::vector<Fraction> split_pool(const Fraction& pool, const std::vector<T>& members, WeightFn weight) {
    std::vector<Fraction> w;
    w.reserve(members.size());
    for (const auto& m : members) w.push_back(Fraction(weight(m)));
    return allocate_by_weights(pool, w);
}

// Turn exact fractions of a whole into integer currency units that add up to
// round(total_units * sum(shares)): floors first, then the leftover units go to
// the largest fractional remainders (ties: lower index first).
std::vector<int64_t> apportion_units(int64_t total_units, const std::vector<Fraction>& shares);

} // namespace faraid
