#include <iostream>
#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "faraid/calculator.h"
#include "faraid/errors.h"
#include "faraid/options.h"
#include "faraid/roster_io.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: faraid_calc <estate_json|-> [--estate AMOUNT] [--decimals N]"
                     " [--method faraid|portions] [--mother-siblings roster|active]"
                     " [--strict] [--verbose] [--pretty]\n";
        return 1;
    }

    std::string input = argv[1];
    std::string estate_override;
    bool pretty = false;

    try {
        faraid::CalcOptions opt = faraid::apply_env_overrides(faraid::CalcOptions{});
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--estate") estate_override = arg_value(i, argc, argv);
            else if (a == "--decimals") opt.currency_decimals = std::stoi(arg_value(i, argc, argv));
            else if (a == "--method") opt.method = faraid::parse_method(arg_value(i, argc, argv));
            else if (a == "--mother-siblings") opt.mother_sibling_basis = faraid::parse_sibling_basis(arg_value(i, argc, argv));
            else if (a == "--strict") opt.strict_unmapped = true;
            else if (a == "--verbose") opt.verbose = true;
            else if (a == "--pretty") pretty = true;
            else {
                std::cerr << "faraid_calc: unknown argument " << a << "\n";
                return 1;
            }
        }

        faraid::EstateInput in = (input == "-")
            ? faraid::read_estate_json(std::cin)
            : faraid::load_estate_json(std::filesystem::path(input));
        if (!estate_override.empty()) in.estate_amount = std::stod(estate_override);

        auto r = faraid::calculate(in, opt);
        std::cout << faraid::to_json(r).dump(pretty ? 2 : -1) << "\n";
        return 0;
    } catch (const faraid::FaraidException& e) {
        std::cerr << "faraid_calc failed (" << faraid::to_string(e.code()) << "): " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "faraid_calc failed: " << e.what() << "\n";
        return 2;
    }
}
