// faraid/cpp/src/result.cpp
#include "faraid/result.h"

namespace faraid {

const char* to_string(CaseTag c) {
    switch (c) {
        case CaseTag::Standard: return "Standard";
        case CaseTag::Awl:      return "Awl";
        case CaseTag::Radd:     return "Radd";
    }
    return "Standard";
}

nlohmann::json to_json(const CalculationResult& r) {
    nlohmann::json j;
    j["estateAmount"] = r.estate_amount;
    j["method"] = to_string(r.method);
    j["baseNumber"] = r.base_number.to_double();
    j["baseNumberExact"] = r.base_number.to_string();
    j["totalParts"] = r.total_parts.to_double();
    j["case"] = to_string(r.case_tag);
    j["notes"] = r.notes;
    j["unmapped"] = r.unmapped;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& h : r.heirs) {
        nlohmann::json e;
        e["id"] = h.heir_id;
        e["name"] = h.name;
        e["heirGroup"] = h.heir_group;
        e["relationship"] = std::string(to_string(h.relationship));
        e["rawRelationship"] = h.raw_relationship;
        e["share"] = h.share_label;
        e["parts"] = h.parts.to_double();
        e["partsExact"] = h.parts.to_string();
        e["percentage"] = h.percentage;
        e["shareAmount"] = h.share_amount;
        e["excluded"] = h.excluded;
        e["exclusionReason"] = h.exclusion_reason;
        arr.push_back(std::move(e));
    }
    j["heirs"] = std::move(arr);

    nlohmann::json groups = nlohmann::json::object();
    for (const auto& kv : r.group_summary) {
        groups[kv.first] = {
            {"count", kv.second.count},
            {"totalShare", kv.second.total_share},
            {"totalParts", kv.second.total_parts.to_double()},
            {"portions", kv.second.portions},
        };
    }
    j["groupSummary"] = std::move(groups);
    return j;
}

} // namespace faraid
