#include <tether/core/status.h>

#include <utility>

namespace tether::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:              return "none";
        case ErrorCode::NotFound:          return "not_found";
        case ErrorCode::DecodeError:       return "decode_error";
        case ErrorCode::ProtocolAnomaly:   return "protocol_anomaly";
        case ErrorCode::HandlerFailure:    return "handler_failure";
        case ErrorCode::TransportTerminal: return "transport_terminal";
        case ErrorCode::Timeout:           return "timeout";
        case ErrorCode::AlreadyRegistered: return "already_registered";
        case ErrorCode::InvalidArgument:   return "invalid_argument";
        case ErrorCode::Shutdown:          return "shutdown";
    }
    return "handler_failure";
}

ErrorCode error_code_from_name(std::string_view name) {
    static constexpr ErrorCode kCodes[] = {
        ErrorCode::None,
        ErrorCode::NotFound,
        ErrorCode::DecodeError,
        ErrorCode::ProtocolAnomaly,
        ErrorCode::HandlerFailure,
        ErrorCode::TransportTerminal,
        ErrorCode::Timeout,
        ErrorCode::AlreadyRegistered,
        ErrorCode::InvalidArgument,
        ErrorCode::Shutdown,
    };
    for (auto code : kCodes) {
        if (name == error_code_name(code)) {
            return code;
        }
    }
    return ErrorCode::HandlerFailure;
}

Status Status::success() {
    return Status{};
}

Status Status::failure(ErrorCode code, std::string message) {
    Status status;
    status.ok = false;
    status.code = code;
    status.message = std::move(message);
    return status;
}

Status Status::with_context(const std::string& context) const {
    if (ok) {
        return *this;
    }
    Status wrapped = *this;
    wrapped.message = message.empty() ? context : context + ": " + message;
    return wrapped;
}

std::string Status::format() const {
    if (ok) {
        return "ok";
    }
    std::string result = error_code_name(code);
    if (!message.empty()) {
        result += ": ";
        result += message;
    }
    return result;
}

} // namespace tether::core
