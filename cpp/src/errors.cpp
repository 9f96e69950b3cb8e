#include "faraid/errors.h"

namespace faraid {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                    return "ok";
        case ErrorCode::IoError:               return "io_error";
        case ErrorCode::ParseError:            return "parse_error";
        case ErrorCode::InvalidArgs:           return "invalid_args";
        case ErrorCode::UnmappedRelationship:  return "unmapped_relationship";
        case ErrorCode::Overflow:              return "overflow";
        case ErrorCode::InternalInconsistency: return "internal_inconsistency";
    }
    return "unknown";
}

} // namespace faraid
