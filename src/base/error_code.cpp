#include "chunkrelay/base/error_code.h"

namespace chunkrelay {

namespace {

class ChunkRelayCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "ChunkRelay";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const ChunkRelayCategory& get_category() {
    static ChunkRelayCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidMessage: return "Invalid message";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::FrameTooLarge: return "Frame too large";
        case ErrorCode::SessionNotFound: return "Transfer session not found";
        case ErrorCode::SessionExists: return "Transfer session already exists";
        case ErrorCode::ReceiverExists: return "Transfer already has a receiver";
        case ErrorCode::Unauthorized: return "Unauthorized sender";
        case ErrorCode::FileTooLarge: return "File exceeds maximum size";
        case ErrorCode::ChunkSaveError: return "Failed to save chunk";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::BindFailed: return "Failed to bind listener";
        default: return "Unknown error";
    }
}

std::string to_wire_code(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "SUCCESS";
        case ErrorCode::InvalidMessage: return "INVALID_MESSAGE";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::FrameTooLarge: return "FRAME_TOO_LARGE";
        case ErrorCode::SessionNotFound: return "SESSION_NOT_FOUND";
        case ErrorCode::SessionExists: return "SESSION_EXISTS";
        case ErrorCode::ReceiverExists: return "RECEIVER_EXISTS";
        case ErrorCode::Unauthorized: return "UNAUTHORIZED";
        case ErrorCode::FileTooLarge: return "FILE_TOO_LARGE";
        case ErrorCode::ChunkSaveError: return "CHUNK_SAVE_ERROR";
        default: return "INTERNAL_ERROR";
    }
}

ChunkRelayError::ChunkRelayError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* ChunkRelayError::what() const noexcept {
    return message_.c_str();
}

} // namespace chunkrelay
