#pragma once

#include <string>
#include <utility>

namespace puresend::core {

enum class ErrorCode {
    SUCCESS = 0,
    IO_ERROR,
    NETWORK_ERROR,
    VERIFICATION_ERROR,
    CAPACITY_ERROR,
    AUTH_ERROR,
    STATE_ERROR,
    TOO_LARGE,
    NOT_FOUND,
    INVALID_ARGUMENT,
    PROTOCOL_ERROR,
    REJECTED,
    CANCELLED
};

const char* to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }

    // "NETWORK_ERROR: connection reset" style text for logs and task error strings.
    std::string describe() const;
};

} // namespace puresend::core
