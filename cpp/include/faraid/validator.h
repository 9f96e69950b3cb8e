// faraid/cpp/include/faraid/validator.h
#pragma once
#include <string>
#include <vector>

#include "faraid/heir.h"
#include "faraid/options.h"
#include "faraid/result.h"

namespace faraid {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
};

// Invariants every CalculationResult must satisfy for its input:
// every heir exactly once, excluded <=> zero parts, parts sum to the base exactly,
// amounts sum to the estate within one currency unit.
ValidationResult validate_result(const EstateInput& input,
                                 const CalculationResult& result,
                                 const CalcOptions& opt = {});

} // namespace faraid
