// faraid/cpp/include/faraid/roster_io.h
#pragma once
#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "faraid/heir.h"
#include "faraid/normalizer.h"

namespace faraid {

// {"estateAmount": N, "heirs": [{"id", "name", "relationship", "gender"?, "heirGroup", "portions"?}]}
// Also accepts estate_amount / heir_group, integer ids and numeric strings for amounts.
// Missing ids become "heir-<n>" (1-based roster position).
EstateInput parse_estate_input(const nlohmann::json& j);

EstateInput read_estate_json(std::istream& in);
EstateInput load_estate_json(const std::filesystem::path& p);

nlohmann::json to_json(const EstateInput& in);
nlohmann::json to_json(const std::vector<AuditEntry>& audit);

} // namespace faraid
