#include "nb/errors.h"

namespace nb {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                return "ok";
        case ErrorCode::InvalidWord:       return "invalid_word";
        case ErrorCode::InvalidArgs:       return "invalid_args";
        case ErrorCode::GlossaryNotClosed: return "glossary_not_closed";
        case ErrorCode::DuplicateEntry:    return "duplicate_entry";
        case ErrorCode::UndefinedWord:     return "undefined_word";
        case ErrorCode::IdSpaceExhausted:  return "id_space_exhausted";
        case ErrorCode::ValidationFailed:  return "validation_failed";
    }
    return "unknown";
}

} // namespace nb
