// faraid/cpp/include/faraid/furud.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "faraid/exclusion.h"
#include "faraid/fraction.h"
#include "faraid/normalizer.h"
#include "faraid/roster.h"

namespace faraid {

constexpr int64_t kBaseParts = 24;

// Working state of one active heir through stages 3 and 4 (parts out of 24).
struct HeirAllocation {
    std::size_t index{0}; // position in the normalized roster
    Relationship relationship{Relationship::Excluded};
    Fraction fixed;
    Fraction residue;
    Fraction radd;
    std::string fixed_label; // "1/4", "2/3 shared"; empty without a fixed share
    bool residuary{false};

    Fraction total() const { return fixed + residue + radd; }
};

struct ShareContext {
    RosterFacts active;           // heirs left after Hajb
    int mother_sibling_count{0};  // siblings counted for the Mother's 1/3 -> 1/6 reduction
};

struct FurudResult {
    std::vector<HeirAllocation> shares; // one per active heir, roster order
    Fraction fixed_total;
};

// Quranic shares for every active heir; heirs without one get zero fixed parts.
FurudResult assign_fixed_shares(const std::vector<NormalizedHeir>& heirs,
                                const ExclusionResult& exclusions,
                                const ShareContext& ctx);

} // namespace faraid
