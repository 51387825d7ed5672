#pragma once
#include <stdexcept>
#include <string>

namespace nb {

enum class ErrorCode {
    Ok = 0,
    InvalidWord,
    InvalidArgs,
    GlossaryNotClosed,
    DuplicateEntry,
    UndefinedWord,
    IdSpaceExhausted,
    ValidationFailed,
};

const char* error_code_name(ErrorCode code);

class NbException : public std::runtime_error {
public:
    NbException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace nb
