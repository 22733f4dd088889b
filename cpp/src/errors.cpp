#include "amb/errors.h"

#include <utility>

namespace amb {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:                  return "ok";
        case ErrorCode::IoError:             return "io_error";
        case ErrorCode::InvalidArgs:         return "invalid_args";
        case ErrorCode::UnsupportedCodepage: return "unsupported_codepage";
        case ErrorCode::MalformedDocument:   return "malformed_document";
        case ErrorCode::UnmappableCharacter: return "unmappable_character";
        case ErrorCode::ArticleTooLarge:     return "article_too_large";
    }
    return "unknown";
}

bool fail(Error* err, ErrorCode code, std::string message) {
    if (err) {
        err->code = code;
        err->message = std::move(message);
    }
    return false;
}

} // namespace amb
