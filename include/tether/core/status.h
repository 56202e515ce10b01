#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether::core {

enum class ErrorCode {
    None,
    NotFound,
    DecodeError,
    ProtocolAnomaly,
    HandlerFailure,
    TransportTerminal,
    Timeout,
    AlreadyRegistered,
    InvalidArgument,
    Shutdown,
};

// Stable snake_case name, used on the wire.
const char* error_code_name(ErrorCode code);

// Unknown names map to HandlerFailure.
ErrorCode error_code_from_name(std::string_view name);

struct Status {
    bool ok = true;
    ErrorCode code = ErrorCode::None;
    std::string message;

    static Status success();
    static Status failure(ErrorCode code, std::string message);

    // Prefix the message with context, keeping the code.
    Status with_context(const std::string& context) const;

    std::string format() const;
};

// Raised by handler code for programmer errors. Only the dispatch worker
// catches it; the queue shuts down afterwards.
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tether::core
