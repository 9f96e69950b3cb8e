// faraid/cpp/include/faraid/calculator.h
#pragma once

#include "faraid/heir.h"
#include "faraid/options.h"
#include "faraid/result.h"

namespace faraid {

// Pure, deterministic: identical input and options always produce identical results.
// Pipeline: normalize -> Hajb -> Furud -> Asabah -> Awl/Radd -> amounts.
//
// Throws FaraidException:
//   InvalidArgs            negative / non-finite estate, bad options, empty or duplicate heir ids
//   UnmappedRelationship   only with opt.strict_unmapped
//   Overflow               estate too large for the currency unit
//   InternalInconsistency  the result failed validate_result (a logic defect)
CalculationResult calculate(const EstateInput& input, const CalcOptions& opt = {});

} // namespace faraid
