#include "puresend/core/error.hpp"

namespace puresend::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
        case ErrorCode::VERIFICATION_ERROR: return "VERIFICATION_ERROR";
        case ErrorCode::CAPACITY_ERROR: return "CAPACITY_ERROR";
        case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
        case ErrorCode::STATE_ERROR: return "STATE_ERROR";
        case ErrorCode::TOO_LARGE: return "TOO_LARGE";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        case ErrorCode::REJECTED: return "REJECTED";
        case ErrorCode::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string Result::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

} // namespace puresend::core
