#ifndef CHUNKRELAY_BASE_ERROR_CODE_H
#define CHUNKRELAY_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace chunkrelay {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // Message errors (1000-1999)
    InvalidMessage = 1002,

    // Transport errors (2000-2999)
    ConnectionClosed = 2002,
    FrameTooLarge = 2004,

    // Session errors (3000-3999)
    SessionNotFound = 3001,
    SessionExists = 3002,
    ReceiverExists = 3003,
    Unauthorized = 3004,
    FileTooLarge = 3005,

    // Storage errors (4000-4999)
    ChunkSaveError = 4001,

    // Startup errors (5000-5999)
    ConfigError = 5001,
    BindFailed = 5002
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Code string carried in the "code" field of outbound error events,
// e.g. SESSION_NOT_FOUND
std::string to_wire_code(ErrorCode code);

class ChunkRelayError : public std::exception {
public:
    ChunkRelayError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace chunkrelay

namespace std {
template <>
struct is_error_code_enum<chunkrelay::ErrorCode> : true_type {};
} // namespace std

#endif // CHUNKRELAY_BASE_ERROR_CODE_H
