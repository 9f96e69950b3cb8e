#include <iostream>
#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "faraid/normalizer.h"
#include "faraid/roster_io.h"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: faraid_audit <estate_json|->\n";
        return 1;
    }

    std::string input = argv[1];

    try {
        faraid::EstateInput in = (input == "-")
            ? faraid::read_estate_json(std::cin)
            : faraid::load_estate_json(std::filesystem::path(input));

        auto audit = faraid::audit_roster(in.heirs);
        size_t unmapped = 0;
        for (const auto& e : audit) {
            if (e.unmapped) ++unmapped;
        }

        nlohmann::json j;
        j["heirs"] = faraid::to_json(audit);
        j["count"] = audit.size();
        j["unmapped"] = unmapped;
        std::cout << j.dump(2) << "\n";
        return unmapped == 0 ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "faraid_audit failed: " << e.what() << "\n";
        return 2;
    }
}
