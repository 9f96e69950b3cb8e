// faraid/cpp/include/faraid/result.h
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "faraid/fraction.h"
#include "faraid/options.h"
#include "faraid/relationship.h"

namespace faraid {

enum class CaseTag { Standard, Awl, Radd };

const char* to_string(CaseTag c);

struct ShareResult {
    std::string heir_id;
    std::string name;
    std::string heir_group;
    std::string raw_relationship;
    Relationship relationship{Relationship::Excluded};

    std::string share_label; // "1/4", "1/6 + Residue", "Excluded"
    Fraction parts;          // out of CalculationResult::base_number
    double percentage{0.0};  // 0..100
    double share_amount{0.0}; // rounded to the currency unit

    bool excluded{false};
    std::string exclusion_reason;
};

struct GroupSummary {
    int count{0};             // excluded members included
    double total_share{0.0};
    Fraction total_parts;
    double portions{0.0};     // legacy weight of the group's members
};

struct CalculationResult {
    Method method{Method::Faraid};
    double estate_amount{0.0};

    Fraction base_number{24};  // 24, or the inflated total under Awl
    Fraction total_parts;
    CaseTag case_tag{CaseTag::Standard};

    std::vector<std::string> notes;
    std::vector<std::string> unmapped; // heir ids whose label was not understood
    std::vector<ShareResult> heirs;    // roster order
    std::map<std::string, GroupSummary> group_summary;
};

nlohmann::json to_json(const CalculationResult& r);

} // namespace faraid
