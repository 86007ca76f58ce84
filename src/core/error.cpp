#include "ixcp/core/error.hpp"

namespace ixcp {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::TransientTransport: return "TransientTransport";
        case ErrorCode::AuthenticationFailure: return "AuthenticationFailure";
        case ErrorCode::AuthenticationRejected: return "AuthenticationRejected";
        case ErrorCode::PayloadRejected: return "PayloadRejected";
        case ErrorCode::DuplicateChunk: return "DuplicateChunk";
        case ErrorCode::IncompleteTransfer: return "IncompleteTransfer";
        case ErrorCode::ContentMismatch: return "ContentMismatch";
        case ErrorCode::KeyUnwrapFailure: return "KeyUnwrapFailure";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::StorageFailure: return "StorageFailure";
        case ErrorCode::IoFailure: return "IoFailure";
        case ErrorCode::CryptoFailure: return "CryptoFailure";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

bool is_transient(ErrorCode code) noexcept {
    return code == ErrorCode::TransientTransport;
}

std::string Error::describe() const {
    return std::string(to_string(code)) + ": " + message;
}

} // namespace ixcp
