#pragma once

#include <expected>
#include <stdexcept>
#include <string>

namespace NOdin {

/// Error kinds reported by the runtime. See TError.
enum class EErrorKind {
    MailboxFull,
    ReceiverGone,
    Timeout,
    ActionError,
    ConfigError,
    NameConflict,
    ProtocolError,
    IoError,
    Internal,
};

const char* ToString(EErrorKind kind);

struct TError {
    EErrorKind Kind = EErrorKind::Internal;
    std::string Message;

    /// "Kind: message", or just the kind name without a message.
    std::string ToString() const;
};

template<typename T = void>
using TResult = std::expected<T, TError>;

inline std::unexpected<TError> MakeError(EErrorKind kind, std::string message = {}) {
    return std::unexpected(TError{kind, std::move(message)});
}

/**
 * @brief Exception form of TError.
 *
 * Thrown for startup failures (ConfigError, NameConflict) and wherever an
 * error has to travel through a future as std::exception_ptr.
 */
class TOdinError: public std::runtime_error {
public:
    explicit TOdinError(TError error);
    TOdinError(EErrorKind kind, const std::string& message);

    const TError& Error() const {
        return Error_;
    }

    EErrorKind Kind() const {
        return Error_.Kind;
    }

private:
    TError Error_;
};

} // namespace NOdin
