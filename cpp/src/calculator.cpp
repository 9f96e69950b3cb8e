// faraid/cpp/src/calculator.cpp
#include "faraid/calculator.h"
#include "faraid/allocation.h"
#include "faraid/asabah.h"
#include "faraid/errors.h"
#include "faraid/exclusion.h"
#include "faraid/furud.h"
#include "faraid/normalizer.h"
#include "faraid/roster.h"
#include "faraid/validator.h"

#include <cmath>
#include <iostream>
#include <unordered_set>
#include <vector>

namespace faraid {

namespace {

constexpr int kMaxDecimals = 6;

void log_line(const CalcOptions& opt, const std::string& msg) {
    if (!opt.verbose) return;
    std::cerr << "[faraid] " << msg << "\n";
}

void check_input(const EstateInput& in, const CalcOptions& opt) {
    if (!std::isfinite(in.estate_amount) || in.estate_amount < 0.0) {
        throw FaraidException(ErrorCode::InvalidArgs, "estate amount must be a finite non-negative number");
    }
    if (opt.currency_decimals < 0 || opt.currency_decimals > kMaxDecimals) {
        throw FaraidException(ErrorCode::InvalidArgs, "currency decimals must be within 0..6");
    }

    std::unordered_set<std::string> ids;
    ids.reserve(in.heirs.size());
    for (const auto& h : in.heirs) {
        if (h.id.empty()) throw FaraidException(ErrorCode::InvalidArgs, "heir without id: " + h.name);
        if (!ids.insert(h.id).second) throw FaraidException(ErrorCode::InvalidArgs, "duplicate heir id: " + h.id);
        if (!std::isfinite(h.portions) || h.portions < 0.0) {
            throw FaraidException(ErrorCode::InvalidArgs, "heir " + h.id + " has invalid portions");
        }
    }
}

int64_t pow10i(int d) {
    int64_t p = 1;
    for (int i = 0; i < d; ++i) p *= 10;
    return p;
}

int64_t to_units(double amount, int decimals) {
    const long double scaled = static_cast<long double>(amount) * static_cast<long double>(pow10i(decimals));
    // keep amounts exactly representable as double
    if (scaled >= 9.0e15L) throw FaraidException(ErrorCode::Overflow, "estate amount too large for currency unit");
    return static_cast<int64_t>(std::llround(scaled));
}

std::string group_key(const ShareResult& s) {
    if (!s.heir_group.empty()) return s.heir_group;
    return std::string(to_string(s.relationship));
}

std::string share_label(const HeirAllocation& a) {
    std::string l;
    if (a.fixed.is_positive()) l = a.fixed_label;
    if (a.residuary) l = l.empty() ? std::string("Residue") : l + " + Residue";
    if (a.radd.is_positive()) l += " + Radd";
    return l;
}

ShareResult base_entry(const NormalizedHeir& h) {
    ShareResult s;
    s.heir_id = h.heir.id;
    s.name = h.heir.name;
    s.heir_group = h.heir.heir_group;
    s.raw_relationship = h.heir.relationship;
    s.relationship = h.relationship;
    return s;
}

void mark_excluded(ShareResult& s, std::string reason) {
    s.excluded = true;
    s.share_label = "Excluded";
    s.parts = Fraction(0);
    s.exclusion_reason = std::move(reason);
}

// Why an active heir ends the Fara'id stages with zero parts.
std::string zero_share_reason(const Adjustment& adj, bool residue_taken) {
    if (adj.case_tag == CaseTag::Radd) {
        return "no fixed share beside these heirs and not a residuary; the surplus returns by Radd";
    }
    if (residue_taken && adj.residuary_group) {
        return "the residue goes to the closer residuary " + std::string(to_string(*adj.residuary_group));
    }
    return "nothing remains after the shares of closer heirs";
}

void collect_unmapped(const std::vector<NormalizedHeir>& heirs, const CalcOptions& opt, CalculationResult& r) {
    for (const auto& h : heirs) {
        if (!h.unmapped) continue;
        if (opt.strict_unmapped) {
            throw FaraidException(ErrorCode::UnmappedRelationship,
                                  "heir " + h.heir.id + ": " + h.reason);
        }
        r.unmapped.push_back(h.heir.id);
        log_line(opt, "unmapped relationship id=" + h.heir.id + " label='" + h.heir.relationship + "'");
    }
}

// Percentages, currency amounts and the per-group summary.
void assemble_totals(CalculationResult& r, const std::vector<Heir>& input_heirs, const CalcOptions& opt) {
    Fraction total;
    for (const auto& s : r.heirs) total += s.parts;
    r.total_parts = total;

    std::vector<Fraction> of_whole;
    of_whole.reserve(r.heirs.size());
    for (const auto& s : r.heirs) of_whole.push_back(s.parts / r.base_number);

    const int64_t units = to_units(r.estate_amount, opt.currency_decimals);
    const auto amounts = apportion_units(units, of_whole);
    const double unit_scale = static_cast<double>(pow10i(opt.currency_decimals));

    for (std::size_t i = 0; i < r.heirs.size(); ++i) {
        auto& s = r.heirs[i];
        s.percentage = of_whole[i].to_double() * 100.0;
        s.share_amount = static_cast<double>(amounts[i]) / unit_scale;

        GroupSummary& g = r.group_summary[group_key(s)];
        g.count++;
        g.total_share += s.share_amount;
        g.total_parts += s.parts;
        g.portions += input_heirs[i].portions;
    }
}

void calculate_faraid(const EstateInput& in, const CalcOptions& opt, CalculationResult& r) {
    const std::vector<NormalizedHeir> heirs = normalize_roster(in.heirs);
    collect_unmapped(heirs, opt, r);

    // stage 2: Hajb over roster-wide predicates
    const RosterFacts roster = facts_for(heirs);
    const ExclusionResult ex = resolve_exclusions(heirs, roster);

    ShareContext ctx;
    ctx.active = facts_for(heirs, ex.excluded_ids);
    ctx.mother_sibling_count = (opt.mother_sibling_basis == SiblingBasis::FullRoster)
                                   ? roster.sibling_count()
                                   : ctx.active.sibling_count();

    // stages 3 + 4
    FurudResult furud = assign_fixed_shares(heirs, ex, ctx);
    Adjustment adj = distribute_and_adjust(furud.shares, ctx.active);

    r.notes = ex.notes;
    r.notes.insert(r.notes.end(), adj.notes.begin(), adj.notes.end());
    for (const auto& n : r.notes) log_line(opt, n);
    r.base_number = adj.base;
    r.case_tag = adj.case_tag;

    std::vector<const HeirAllocation*> by_index(heirs.size(), nullptr);
    bool residue_taken = false;
    for (const auto& a : furud.shares) {
        by_index[a.index] = &a;
        residue_taken = residue_taken || a.residuary;
    }

    r.heirs.reserve(heirs.size());
    for (std::size_t i = 0; i < heirs.size(); ++i) {
        const auto& h = heirs[i];
        ShareResult s = base_entry(h);

        const HeirAllocation* a = by_index[i];
        if (!a) {
            auto it = ex.reasons.find(h.heir.id);
            mark_excluded(s, it != ex.reasons.end() ? it->second : std::string("excluded"));
        } else if (a->total().is_zero()) {
            const std::string why = zero_share_reason(adj, residue_taken);
            mark_excluded(s, why);
            r.notes.push_back(h.heir.name + " (" + std::string(to_string(h.relationship)) +
                              ") receives nothing: " + why);
        } else {
            s.parts = a->total();
            s.share_label = share_label(*a);
        }
        r.heirs.push_back(std::move(s));
    }

    log_line(opt, std::string("case=") + to_string(r.case_tag) + " base=" + r.base_number.to_string() +
                      " heirs=" + std::to_string(r.heirs.size()) +
                      " excluded=" + std::to_string(ex.excluded_ids.size()));
}

void calculate_by_portions(const EstateInput& in, const CalcOptions& opt, CalculationResult& r) {
    const std::vector<NormalizedHeir> heirs = normalize_roster(in.heirs);
    collect_unmapped(heirs, opt, r);

    Fraction total;
    std::vector<Fraction> portions;
    portions.reserve(heirs.size());
    for (const auto& h : heirs) {
        portions.push_back(Fraction::from_decimal(h.heir.portions));
        total += portions.back();
    }

    r.case_tag = CaseTag::Standard;
    r.base_number = total.is_zero() ? Fraction(kBaseParts) : total;
    r.notes.push_back("Legacy portions override: estate split by stored portions (total " +
                      r.base_number.to_string() + "), Fara'id rules not applied");

    r.heirs.reserve(heirs.size());
    for (std::size_t i = 0; i < heirs.size(); ++i) {
        ShareResult s = base_entry(heirs[i]);
        if (portions[i].is_zero()) {
            mark_excluded(s, "no portions assigned");
        } else {
            s.parts = portions[i];
            s.share_label = portions[i].to_string() + " of " + r.base_number.to_string() + " portions";
        }
        r.heirs.push_back(std::move(s));
    }
}

} // namespace

CalculationResult calculate(const EstateInput& input, const CalcOptions& opt) {
    check_input(input, opt);

    CalculationResult r;
    r.method = opt.method;
    r.estate_amount = input.estate_amount;

    if (input.heirs.empty()) {
        r.notes.push_back("Empty heir roster: nothing to distribute");
        return r;
    }
    if (input.estate_amount == 0.0) {
        r.notes.push_back("Estate amount is zero: nothing to distribute");
        return r;
    }

    if (opt.method == Method::LegacyPortions) {
        calculate_by_portions(input, opt, r);
    } else {
        calculate_faraid(input, opt, r);
    }
    assemble_totals(r, input.heirs, opt);

    const ValidationResult vr = validate_result(input, r, opt);
    if (!vr.ok) {
        throw FaraidException(ErrorCode::InternalInconsistency, "result failed validation: " + vr.errors.front());
    }
    return r;
}

} // namespace faraid
