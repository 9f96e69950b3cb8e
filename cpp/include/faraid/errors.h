#pragma once
#include <stdexcept>
#include <string>

namespace faraid {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    InvalidArgs,
    UnmappedRelationship,
    Overflow,
    InternalInconsistency,
};

const char* to_string(ErrorCode code);

class FaraidException : public std::runtime_error {
public:
    explicit FaraidException(const std::string& msg)
        : std::runtime_error(msg), code_(ErrorCode::InvalidArgs) {}
    FaraidException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace faraid
