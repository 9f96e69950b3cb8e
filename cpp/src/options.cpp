// faraid/cpp/src/options.cpp
#include "faraid/options.h"
#include "faraid/errors.h"

#include <cstdlib>
#include <cstring>
#include <string>

namespace faraid {

namespace {

bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

long env_long(const char* key, long defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') {
        throw FaraidException(ErrorCode::InvalidArgs, std::string("invalid integer in ") + key + ": " + s);
    }
    return v;
}

const char* env_str(const char* key) {
    const char* s = std::getenv(key);
    if (!s || !*s) return nullptr;
    return s;
}

} // namespace

const char* to_string(Method m) {
    switch (m) {
        case Method::Faraid:         return "faraid";
        case Method::LegacyPortions: return "portions";
    }
    return "faraid";
}

const char* to_string(SiblingBasis b) {
    switch (b) {
        case SiblingBasis::FullRoster: return "roster";
        case SiblingBasis::ActiveOnly: return "active";
    }
    return "roster";
}

Method parse_method(std::string_view s) {
    if (s == "faraid") return Method::Faraid;
    if (s == "portions" || s == "legacy" || s == "legacy_portions") return Method::LegacyPortions;
    throw FaraidException(ErrorCode::InvalidArgs, "unknown method: " + std::string(s));
}

SiblingBasis parse_sibling_basis(std::string_view s) {
    if (s == "roster") return SiblingBasis::FullRoster;
    if (s == "active") return SiblingBasis::ActiveOnly;
    throw FaraidException(ErrorCode::InvalidArgs, "unknown sibling basis: " + std::string(s));
}

CalcOptions apply_env_overrides(CalcOptions opt) {
    if (const char* m = env_str("FARAID_METHOD")) opt.method = parse_method(m);
    if (const char* b = env_str("FARAID_MOTHER_SIBLINGS")) opt.mother_sibling_basis = parse_sibling_basis(b);
    opt.currency_decimals = (int)env_long("FARAID_CURRENCY_DECIMALS", opt.currency_decimals);
    opt.strict_unmapped = env_bool("FARAID_STRICT_UNMAPPED", opt.strict_unmapped);
    opt.verbose = env_bool("FARAID_VERBOSE", opt.verbose);
    return opt;
}

BatchOptions apply_env_overrides(BatchOptions opt) {
    const long thr = env_long("FARAID_BATCH_THREADS", (long)opt.max_threads);
    if (thr > 0) opt.max_threads = (unsigned)thr;
    opt.fail_fast = env_bool("FARAID_BATCH_FAIL_FAST", opt.fail_fast);
    return opt;
}

} // namespace faraid
