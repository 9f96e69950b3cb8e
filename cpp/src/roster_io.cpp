// faraid/cpp/src/roster_io.cpp
#include "faraid/roster_io.h"
#include "faraid/errors.h"

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace faraid {

namespace {

const json* find_any(const json& obj, const char* a, const char* b) {
    auto it = obj.find(a);
    if (it != obj.end() && !it->is_null()) return &*it;
    it = obj.find(b);
    if (it != obj.end() && !it->is_null()) return &*it;
    return nullptr;
}

// number, or a numeric string as stored by SQL numeric columns
double number_field(const json* v, const std::string& what, double defv) {
    if (!v) return defv;
    if (v->is_number()) return v->get<double>();
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        const double d = std::strtod(s.c_str(), &end);
        if (!s.empty() && end && *end == '\0') return d;
    }
    throw FaraidException(ErrorCode::InvalidArgs, what + " must be a number");
}

std::string string_field(const json* v, const std::string& what) {
    if (!v) return {};
    if (v->is_string()) return v->get<std::string>();
    throw FaraidException(ErrorCode::InvalidArgs, what + " must be a string");
}

std::string id_field(const json* v, size_t index) {
    if (!v) return "heir-" + std::to_string(index + 1);
    if (v->is_string()) {
        std::string id = v->get<std::string>();
        return id.empty() ? "heir-" + std::to_string(index + 1) : id;
    }
    if (v->is_number_integer()) return v->dump();
    throw FaraidException(ErrorCode::InvalidArgs, "heir id must be a string or integer");
}

} // namespace

EstateInput parse_estate_input(const json& j) {
    if (!j.is_object()) throw FaraidException(ErrorCode::InvalidArgs, "estate input must be a JSON object");

    EstateInput in;
    in.estate_amount = number_field(find_any(j, "estateAmount", "estate_amount"), "estateAmount", 0.0);

    const json* heirs = find_any(j, "heirs", "heirs");
    if (!heirs) return in;
    if (!heirs->is_array()) throw FaraidException(ErrorCode::InvalidArgs, "heirs must be an array");

    in.heirs.reserve(heirs->size());
    for (size_t i = 0; i < heirs->size(); ++i) {
        const json& e = (*heirs)[i];
        if (!e.is_object()) throw FaraidException(ErrorCode::InvalidArgs, "heir entry must be an object");

        Heir h;
        h.id = id_field(find_any(e, "id", "heir_id"), i);
        const std::string where = "heir " + h.id + ": ";
        h.name = string_field(find_any(e, "name", "name"), where + "name");
        h.relationship = string_field(find_any(e, "relationship", "relation"), where + "relationship");
        h.gender = string_field(find_any(e, "gender", "sex"), where + "gender");
        h.heir_group = string_field(find_any(e, "heirGroup", "heir_group"), where + "heirGroup");
        h.portions = number_field(find_any(e, "portions", "portions"), where + "portions", 0.0);
        in.heirs.push_back(std::move(h));
    }
    return in;
}

EstateInput read_estate_json(std::istream& in) {
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw FaraidException(ErrorCode::ParseError, std::string("failed parsing estate json: ") + e.what());
    }
    return parse_estate_input(j);
}

EstateInput load_estate_json(const std::filesystem::path& p) {
    std::ifstream in(p);
    if (!in) throw FaraidException(ErrorCode::IoError, "cannot open " + p.string());
    return read_estate_json(in);
}

json to_json(const EstateInput& in) {
    json j;
    j["estateAmount"] = in.estate_amount;
    json arr = json::array();
    for (const auto& h : in.heirs) {
        arr.push_back({
            {"id", h.id},
            {"name", h.name},
            {"relationship", h.relationship},
            {"gender", h.gender},
            {"heirGroup", h.heir_group},
            {"portions", h.portions},
        });
    }
    j["heirs"] = std::move(arr);
    return j;
}

json to_json(const std::vector<AuditEntry>& audit) {
    json arr = json::array();
    for (const auto& e : audit) {
        arr.push_back({
            {"id", e.id},
            {"raw", e.raw},
            {"canonical", std::string(to_string(e.canonical))},
            {"gender", std::string(to_string(e.gender))},
            {"unmapped", e.unmapped},
            {"reason", e.reason},
        });
    }
    return arr;
}

} // namespace faraid
