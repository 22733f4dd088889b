#pragma once
#include <stdexcept>
#include <string>

namespace amb {

enum class ErrorCode {
    Ok = 0,
    IoError,
    InvalidArgs,
    UnsupportedCodepage,
    MalformedDocument,
    UnmappableCharacter,
    ArticleTooLarge,
};

struct Error {
    ErrorCode code{ErrorCode::Ok};
    std::string message;
};

const char* error_code_name(ErrorCode c);

// fills *err when err != nullptr, always returns false (for "return fail(...)")
bool fail(Error* err, ErrorCode code, std::string message);

class AmbException : public std::runtime_error {
public:
    explicit AmbException(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace amb
