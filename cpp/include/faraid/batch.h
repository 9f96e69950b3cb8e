// faraid/cpp/include/faraid/batch.h
#pragma once
#include <cstdint>
#include <filesystem>

#include "faraid/options.h"

namespace faraid {

struct BatchStats {
    uint64_t cases{0};
    uint64_t ok{0};
    uint64_t failed{0};
    unsigned threads{0};
};

// One estate case per JSONL line ({"caseId"?, "estateAmount", "heirs"}) ->
// one result JSON per line, in input order. A bad case produces
// {"line", "caseId", "error", "code"} and counts as failed; the run goes on unless
// bopt.fail_fast is set, in which case reading stops and the first error is rethrown.
// Throws FaraidException(IoError) when the files cannot be opened or written.
BatchStats run_batch_jsonl(const std::filesystem::path& cases_jsonl,
                           const std::filesystem::path& results_jsonl,
                           const BatchOptions& bopt,
                           const CalcOptions& opt);

} // namespace faraid
