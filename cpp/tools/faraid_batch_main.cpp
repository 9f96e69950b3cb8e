#include <iostream>
#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "faraid/batch.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: faraid_batch <cases_jsonl> <results_jsonl> [--threads N] [--fail-fast]"
                     " [--method faraid|portions] [--decimals N] [--mother-siblings roster|active] [--strict]\n";
        return 1;
    }

    std::filesystem::path cases = argv[1];
    std::filesystem::path results = argv[2];

    try {
        faraid::BatchOptions bopt = faraid::apply_env_overrides(faraid::BatchOptions{});
        faraid::CalcOptions opt = faraid::apply_env_overrides(faraid::CalcOptions{});
        for (int i = 3; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--threads") bopt.max_threads = (unsigned)std::stoul(arg_value(i, argc, argv));
            else if (a == "--fail-fast") bopt.fail_fast = true;
            else if (a == "--method") opt.method = faraid::parse_method(arg_value(i, argc, argv));
            else if (a == "--decimals") opt.currency_decimals = std::stoi(arg_value(i, argc, argv));
            else if (a == "--mother-siblings") opt.mother_sibling_basis = faraid::parse_sibling_basis(arg_value(i, argc, argv));
            else if (a == "--strict") opt.strict_unmapped = true;
            else {
                std::cerr << "faraid_batch: unknown argument " << a << "\n";
                return 1;
            }
        }
        // per-case logging would interleave across workers
        opt.verbose = false;

        auto st = faraid::run_batch_jsonl(cases, results, bopt, opt);
        nlohmann::json j;
        j["cases"] = st.cases;
        j["ok"] = st.ok;
        j["failed"] = st.failed;
        j["threads"] = st.threads;
        j["results"] = results.string();
        std::cout << j.dump() << "\n";
        return st.failed == 0 ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "faraid_batch failed: " << e.what() << "\n";
        return 2;
    }
}
