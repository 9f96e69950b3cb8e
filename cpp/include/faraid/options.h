// faraid/cpp/include/faraid/options.h
#pragma once
#include <cstdint>
#include <string_view>

namespace faraid {

enum class Method {
    Faraid,         // Hajb + Furud + Asabah + Awl/Radd
    LegacyPortions, // split by each heir's stored portions weight
};

// Which siblings count towards reducing the Mother from 1/3 to 1/6.
enum class SiblingBasis {
    FullRoster, // every sibling in the roster, blocked ones included
    ActiveOnly, // siblings left after Hajb
};

struct CalcOptions {
    Method method{Method::Faraid};

    // currency unit = 10^-currency_decimals (0..6)
    int currency_decimals{2};

    SiblingBasis mother_sibling_basis{SiblingBasis::FullRoster};

    // if true -> an unmapped relationship label raises instead of becoming Excluded
    bool strict_unmapped{false};

    // diagnostics on stderr
    bool verbose{false};
};

struct BatchOptions {
    unsigned max_threads{8};
    uint32_t inflight{0}; // 0 => auto (4*threads), bounds queue sizes
    bool fail_fast{false}; // stop at the first failed case and throw its error
};

const char* to_string(Method m);
const char* to_string(SiblingBasis b);

// "faraid" | "portions" (also "legacy", "legacy_portions"); throws FaraidException otherwise
Method parse_method(std::string_view s);
// "roster" | "active"; throws FaraidException otherwise
SiblingBasis parse_sibling_basis(std::string_view s);

// FARAID_METHOD, FARAID_CURRENCY_DECIMALS, FARAID_MOTHER_SIBLINGS,
// FARAID_STRICT_UNMAPPED, FARAID_VERBOSE
CalcOptions apply_env_overrides(CalcOptions opt);

// FARAID_BATCH_THREADS, FARAID_BATCH_FAIL_FAST
BatchOptions apply_env_overrides(BatchOptions opt);

} // namespace faraid
