#include "errors.hpp"

namespace NOdin {

const char* ToString(EErrorKind kind) {
    switch (kind) {
    case EErrorKind::MailboxFull: return "MailboxFull";
    case EErrorKind::ReceiverGone: return "ReceiverGone";
    case EErrorKind::Timeout: return "Timeout";
    case EErrorKind::ActionError: return "ActionError";
    case EErrorKind::ConfigError: return "ConfigError";
    case EErrorKind::NameConflict: return "NameConflict";
    case EErrorKind::ProtocolError: return "ProtocolError";
    case EErrorKind::IoError: return "IoError";
    case EErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

std::string TError::ToString() const {
    std::string result = NOdin::ToString(Kind);
    if (!Message.empty()) {
        result += ": " + Message;
    }
    return result;
}

TOdinError::TOdinError(TError error)
    : std::runtime_error(error.ToString())
    , Error_(std::move(error))
{ }

TOdinError::TOdinError(EErrorKind kind, const std::string& message)
    : TOdinError(TError{kind, message})
{ }

} // namespace NOdin
