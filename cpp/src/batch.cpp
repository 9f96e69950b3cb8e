// faraid/cpp/src/batch.cpp
#include "faraid/batch.h"
#include "faraid/calculator.h"
#include "faraid/errors.h"
#include "faraid/result.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>
#include <simdjson.h>

namespace fs = std::filesystem;

namespace faraid {

namespace {

// --------------------
// bounded queue (streaming pipeline)
// --------------------
template <class T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t cap) : cap_(cap) {}

    bool push(T&& v) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_not_full_.wait(lk, [&] { return closed_ || q_.size() < cap_; });
        if (closed_) return false;
        q_.push_back(std::move(v));
        cv_not_empty_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) return false; // closed and empty
        out = std::move(q_.front());
        q_.pop_front();
        cv_not_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_not_empty_.notify_all();
        cv_not_full_.notify_all();
    }

private:
    size_t cap_{0};
    std::mutex mu_;
    std::condition_variable cv_not_empty_;
    std::condition_variable cv_not_full_;
    std::deque<T> q_;
    bool closed_{false};
};

// --------------------
// simdjson -> EstateInput
// --------------------

static bool find_field(const simdjson::dom::element& obj, const char* a, const char* b,
                       simdjson::dom::element& out) {
    if (!obj.at_key(a).get(out) && !out.is_null()) return true;
    if (b && !obj.at_key(b).get(out) && !out.is_null()) return true;
    return false;
}

static double number_value(const simdjson::dom::element& v, const std::string& what) {
    double d = 0.0;
    if (!v.get(d)) return d;

    std::string_view sv;
    if (!v.get(sv)) {
        const std::string s(sv);
        char* end = nullptr;
        d = std::strtod(s.c_str(), &end);
        if (!s.empty() && end && *end == '\0') return d;
    }
    throw FaraidException(ErrorCode::InvalidArgs, what + " must be a number");
}

static std::string string_value(const simdjson::dom::element& obj, const char* a, const char* b,
                                const std::string& what) {
    simdjson::dom::element v;
    if (!find_field(obj, a, b, v)) return {};
    std::string_view sv;
    if (v.get(sv)) throw FaraidException(ErrorCode::InvalidArgs, what + " must be a string");
    return std::string(sv);
}

static std::string id_value(const simdjson::dom::element& obj, const char* a, const char* b) {
    simdjson::dom::element v;
    if (!find_field(obj, a, b, v)) return {};

    std::string_view sv;
    if (!v.get(sv)) return std::string(sv);
    int64_t i = 0;
    if (!v.get(i)) return std::to_string(i);
    uint64_t u = 0;
    if (!v.get(u)) return std::to_string(u);
    throw FaraidException(ErrorCode::InvalidArgs, std::string(a) + " must be a string or integer");
}

static EstateInput estate_from_element(const simdjson::dom::element& doc) {
    if (!doc.is_object()) throw FaraidException(ErrorCode::InvalidArgs, "case must be a JSON object");

    EstateInput in;
    simdjson::dom::element v;
    if (find_field(doc, "estateAmount", "estate_amount", v)) in.estate_amount = number_value(v, "estateAmount");

    if (!find_field(doc, "heirs", nullptr, v)) return in;
    simdjson::dom::array heirs;
    if (v.get(heirs)) throw FaraidException(ErrorCode::InvalidArgs, "heirs must be an array");

    size_t idx = 0;
    for (simdjson::dom::element e : heirs) {
        if (!e.is_object()) throw FaraidException(ErrorCode::InvalidArgs, "heir entry must be an object");

        Heir h;
        h.id = id_value(e, "id", "heir_id");
        if (h.id.empty()) h.id = "heir-" + std::to_string(idx + 1);
        const std::string where = "heir " + h.id + ": ";

        h.name = string_value(e, "name", nullptr, where + "name");
        h.relationship = string_value(e, "relationship", "relation", where + "relationship");
        h.gender = string_value(e, "gender", "sex", where + "gender");
        h.heir_group = string_value(e, "heirGroup", "heir_group", where + "heirGroup");

        simdjson::dom::element p;
        if (find_field(e, "portions", nullptr, p)) h.portions = number_value(p, where + "portions");

        in.heirs.push_back(std::move(h));
        ++idx;
    }
    return in;
}

// --------------------
// pipeline structures
// --------------------
struct CaseLine {
    uint64_t seq{0};
    uint64_t line_no{0};
    std::string text;
};

struct CaseOut {
    uint64_t seq{0};
    std::string text;
};

} // namespace

BatchStats run_batch_jsonl(const fs::path& cases_jsonl,
                           const fs::path& results_jsonl,
                           const BatchOptions& bopt_in,
                           const CalcOptions& opt) {
    BatchOptions bopt = bopt_in;
    BatchStats st;

    std::ifstream in(cases_jsonl, std::ios::binary);
    if (!in) throw FaraidException(ErrorCode::IoError, "cannot open cases: " + cases_jsonl.string());

    std::ofstream out(results_jsonl, std::ios::binary | std::ios::trunc);
    if (!out) throw FaraidException(ErrorCode::IoError, "cannot open results: " + results_jsonl.string());

    // derive threads / inflight bounds
    unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;
    unsigned max_thr = (bopt.max_threads > 0 ? bopt.max_threads : 8u);
    unsigned num_threads = std::min<unsigned>(hw, max_thr);
    if (num_threads == 0) num_threads = 1;

    if (bopt.inflight == 0) {
        bopt.inflight = std::max<uint32_t>(32u, (uint32_t)(num_threads * 4u));
    }

    BoundedQueue<CaseLine> q_lines(bopt.inflight);
    BoundedQueue<CaseOut>  q_out(bopt.inflight);

    std::atomic<bool> stop{false};
    std::atomic<uint64_t> n_ok{0};
    std::atomic<uint64_t> n_failed{0};

    std::mutex first_err_mu;
    std::string first_err;
    ErrorCode first_err_code{ErrorCode::Ok};

    // writer thread: results in input order
    uint64_t written = 0;
    std::thread writer([&]() {
        std::unordered_map<uint64_t, CaseOut> pending;
        pending.reserve((size_t)bopt.inflight * 2);

        uint64_t expect = 0;
        CaseOut r;
        while (q_out.pop(r)) {
            pending.emplace(r.seq, std::move(r));

            while (true) {
                auto it = pending.find(expect);
                if (it == pending.end()) break;
                out << it->second.text << '\n';
                pending.erase(it);
                ++expect;
            }
        }
        out.flush();
        written = expect;
    });

    // worker threads
    std::vector<std::thread> workers;
    workers.reserve(num_threads);

    for (unsigned t = 0; t < num_threads; ++t) {
        workers.emplace_back([&]() {
            simdjson::dom::parser parser;

            CaseLine c;
            while (q_lines.pop(c)) {
                nlohmann::json j;
                std::string case_id;
                try {
                    simdjson::dom::element doc;
                    auto err = parser.parse(c.text).get(doc);
                    if (err) throw FaraidException(ErrorCode::ParseError, simdjson::error_message(err));

                    case_id = id_value(doc, "caseId", "case_id");
                    const EstateInput input = estate_from_element(doc);
                    j = to_json(calculate(input, opt));
                    n_ok.fetch_add(1, std::memory_order_relaxed);
                } catch (const std::exception& e) {
                    const FaraidException* fe = dynamic_cast<const FaraidException*>(&e);
                    j = nlohmann::json::object();
                    j["error"] = e.what();
                    j["code"] = fe ? to_string(fe->code()) : "internal";
                    n_failed.fetch_add(1, std::memory_order_relaxed);

                    if (bopt.fail_fast) {
                        std::lock_guard<std::mutex> lk(first_err_mu);
                        if (first_err.empty()) {
                            first_err = "line " + std::to_string(c.line_no) + ": " + e.what();
                            first_err_code = fe ? fe->code() : ErrorCode::InternalInconsistency;
                        }
                        stop.store(true, std::memory_order_relaxed);
                    }
                }

                j["line"] = c.line_no;
                if (!case_id.empty()) j["caseId"] = case_id;

                CaseOut o;
                o.seq = c.seq;
                o.text = j.dump();
                q_out.push(std::move(o));
            }
        });
    }

    // reader (streaming JSONL)
    std::thread reader([&]() {
        std::string line;
        uint64_t line_no = 0;
        uint64_t seq = 0;

        while (std::getline(in, line)) {
            ++line_no;
            if (stop.load(std::memory_order_relaxed)) break;
            if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) continue;

            CaseLine c;
            c.seq = seq++;
            c.line_no = line_no;
            c.text = std::move(line);
            if (!q_lines.push(std::move(c))) break;
            line.clear();
        }
        q_lines.close();
    });

    // join pipeline
    reader.join();
    for (auto& th : workers) th.join();

    q_out.close();
    writer.join();

    if (!out) throw FaraidException(ErrorCode::IoError, "results write failed: " + results_jsonl.string());
    if (bopt.fail_fast && !first_err.empty()) throw FaraidException(first_err_code, first_err);

    st.ok = n_ok.load(std::memory_order_relaxed);
    st.failed = n_failed.load(std::memory_order_relaxed);
    st.cases = written;
    st.threads = num_threads;
    return st;
}

} // namespace faraid
