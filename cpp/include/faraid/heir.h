// faraid/cpp/include/faraid/heir.h
#pragma once
#include <string>
#include <vector>

namespace faraid {

struct Heir {
    std::string id;           // unique within the roster
    std::string name;         // display name
    std::string relationship; // raw label, e.g. "Child", "Spouse", "Paternal Half Sister"
    std::string gender;       // optional raw gender, e.g. "Male", "f"
    std::string heir_group;   // free-text UI grouping, e.g. "Sons"
    double portions{0.0};     // legacy weight, only used by Method::LegacyPortions
};

struct EstateInput {
    double estate_amount{0.0}; // net distributable estate, >= 0
    std::vector<Heir> heirs;
};

} // namespace faraid
