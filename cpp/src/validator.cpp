// faraid/cpp/src/validator.cpp
#include "faraid/validator.h"

#include <cmath>
#include <sstream>
#include <unordered_map>

namespace faraid {

namespace {

bool is_degenerate(const EstateInput& input) {
    return input.heirs.empty() || input.estate_amount == 0.0;
}

} // namespace

ValidationResult validate_result(const EstateInput& input,
                                 const CalculationResult& r,
                                 const CalcOptions& opt) {
    ValidationResult vr;

    if (is_degenerate(input)) {
        if (!r.heirs.empty()) vr.errors.push_back("degenerate input must produce an empty heir list");
        if (!r.total_parts.is_zero()) vr.errors.push_back("degenerate input must produce zero total parts");
        vr.ok = vr.errors.empty();
        return vr;
    }

    // every heir exactly once
    std::unordered_map<std::string, int> seen;
    for (const auto& h : r.heirs) ++seen[h.heir_id];
    for (const auto& h : input.heirs) {
        auto it = seen.find(h.id);
        const int n = (it == seen.end()) ? 0 : it->second;
        if (n != 1) {
            std::ostringstream oss;
            oss << "heir " << h.id << " appears " << n << " times in the result";
            vr.errors.push_back(oss.str());
        }
    }
    if (r.heirs.size() != input.heirs.size()) {
        std::ostringstream oss;
        oss << "result size mismatch: result=" << r.heirs.size() << " input=" << input.heirs.size();
        vr.errors.push_back(oss.str());
    }

    // excluded <=> zero parts
    Fraction sum;
    bool any_sharer = false;
    for (const auto& h : r.heirs) {
        if (h.excluded) {
            if (!h.parts.is_zero()) vr.errors.push_back("excluded heir " + h.heir_id + " holds parts");
            if (h.share_amount != 0.0) vr.errors.push_back("excluded heir " + h.heir_id + " holds an amount");
        } else {
            if (!h.parts.is_positive()) vr.errors.push_back("heir " + h.heir_id + " is neither excluded nor sharing");
            any_sharer = true;
        }
        sum += h.parts;
    }

    if (sum != r.total_parts) {
        vr.errors.push_back("parts sum " + sum.to_string() + " != totalParts " + r.total_parts.to_string());
    }
    if (any_sharer && sum != r.base_number) {
        vr.errors.push_back("parts sum " + sum.to_string() + " != baseNumber " + r.base_number.to_string());
    }

    if (r.method == Method::Faraid) {
        if (r.base_number < Fraction(24)) vr.errors.push_back("base below 24");
        if ((r.case_tag == CaseTag::Awl) != (r.base_number > Fraction(24))) {
            vr.errors.push_back("case tag does not match base " + r.base_number.to_string());
        }
    }

    // amounts within one currency unit
    if (any_sharer) {
        double total = 0.0;
        for (const auto& h : r.heirs) total += h.share_amount;
        const double unit = std::pow(10.0, -opt.currency_decimals);
        if (std::fabs(total - input.estate_amount) > unit + 1e-9 * std::fabs(input.estate_amount)) {
            std::ostringstream oss;
            oss.precision(17);
            oss << "amounts sum " << total << " differs from estate " << input.estate_amount
                << " by more than one currency unit";
            vr.errors.push_back(oss.str());
        }
    }

    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace faraid
