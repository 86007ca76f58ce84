#pragma once

#include <string>

namespace ixcp {

/**
 * @brief Failure classes shared by every module
 *
 * The upload orchestrator decides between retrying, failing the chunk and
 * failing the file purely from this code, so transports and the receiver
 * must classify errors precisely.
 */
enum class ErrorCode {
    TransientTransport,      ///< Network failure, timeout or 5xx; retried with backoff
    AuthenticationFailure,   ///< AEAD tag or associated data did not verify
    AuthenticationRejected,  ///< Receiver refused the bearer key (401/403)
    PayloadRejected,         ///< Receiver refused the packet as malformed (400/422)
    DuplicateChunk,          ///< Chunk already present in the buffer
    IncompleteTransfer,      ///< Finalize found missing chunk indices
    ContentMismatch,         ///< Assembled file does not hash to the buffered content
    KeyUnwrapFailure,        ///< Wrapped session key is malformed or for another key
    InvalidArgument,
    NotFound,
    StorageFailure,
    IoFailure,
    CryptoFailure,
    ProtocolError,
    Cancelled
};

struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    // "<code>: <message>"
    std::string describe() const;
};

const char* to_string(ErrorCode code) noexcept;

/// True only for failures worth retrying with the same request.
bool is_transient(ErrorCode code) noexcept;

inline Error make_error(ErrorCode code, std::string message) {
    return Error(code, std::move(message));
}

} // namespace ixcp
