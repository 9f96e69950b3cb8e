#include <cassert>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "faraid/batch.h"
#include "faraid/errors.h"

static std::filesystem::path mk_tmp_dir() {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("faraid_test_" + std::to_string((uint64_t)std::time(nullptr)));
    std::filesystem::create_directories(p);
    return p;
}

static std::filesystem::path test_data_file(const char* name) {
#ifndef FARAID_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name; // fallback
#else
    return std::filesystem::path(FARAID_TEST_DATA_DIR) / name;
#endif
}

static std::vector<nlohmann::json> read_lines(const std::filesystem::path& p) {
    std::vector<nlohmann::json> out;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

int main() {
    auto out_dir = mk_tmp_dir();
    auto cases = test_data_file("cases.jsonl");
    auto results = out_dir / "results.jsonl";

    faraid::BatchOptions bopt;
    bopt.max_threads = 3;
    faraid::CalcOptions opt;

    auto st = faraid::run_batch_jsonl(cases, results, bopt, opt);
    assert(st.cases == 6);
    assert(st.ok == 4);
    assert(st.failed == 2);
    assert(st.threads >= 1);

    auto rows = read_lines(results);
    assert(rows.size() == 6);

    // input order, blank line skipped but counted
    assert(rows[0]["caseId"] == "single-son");
    assert(rows[0]["line"] == 1);
    assert(rows[1]["case"] == "Radd");
    assert(rows[2]["caseId"] == "awl");
    assert(rows[2]["line"] == 4);
    assert(rows[2]["case"] == "Awl");
    assert(rows[2]["baseNumber"].get<double>() == 28.0);
    assert(rows[2]["heirs"][0]["id"] == "1");

    assert(rows[3]["caseId"] == "bad-estate");
    assert(rows[3].contains("error"));
    assert(rows[3]["code"] == "invalid_args");

    assert(rows[4]["caseId"] == "generic");
    assert(rows[4]["heirs"][2]["relationship"] == "Son");
    assert(rows[4]["heirs"][2]["shareAmount"].get<double>() == 1700000.0);

    assert(rows[5]["code"] == "parse_error");
    assert(!rows[5].contains("caseId"));

    // fail-fast rethrows the first bad case
    faraid::BatchOptions strict = bopt;
    strict.fail_fast = true;
    bool thrown = false;
    try {
        (void)faraid::run_batch_jsonl(cases, out_dir / "strict.jsonl", strict, opt);
    } catch (const faraid::FaraidException& e) {
        // either bad line may fail first across workers
        thrown = true;
        assert(e.code() == faraid::ErrorCode::InvalidArgs || e.code() == faraid::ErrorCode::ParseError);
    }
    assert(thrown);

    // the rethrown error keeps the code of the failing line
    auto malformed = out_dir / "malformed.jsonl";
    {
        std::ofstream m(malformed);
        m << "{not json\n";
    }
    bool parse_err = false;
    try {
        (void)faraid::run_batch_jsonl(malformed, out_dir / "malformed_out.jsonl", strict, opt);
    } catch (const faraid::FaraidException& e) {
        parse_err = (e.code() == faraid::ErrorCode::ParseError);
        assert(std::string(e.what()).find("line 1") != std::string::npos);
    }
    assert(parse_err);

    bool io_err = false;
    try {
        (void)faraid::run_batch_jsonl(out_dir / "missing.jsonl", out_dir / "x.jsonl", bopt, opt);
    } catch (const faraid::FaraidException& e) {
        io_err = (e.code() == faraid::ErrorCode::IoError);
    }
    assert(io_err);

    std::filesystem::remove_all(out_dir);
    std::cout << "OK\n";
    return 0;
}
