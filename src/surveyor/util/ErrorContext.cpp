#include "ErrorContext.hpp"

namespace surveyor {

const char* ErrorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Store:
        return "StoreError";
    case ErrorKind::DuplicateHandler:
        return "DuplicateHandler";
    case ErrorKind::TraversalBound:
        return "TraversalBound";
    case ErrorKind::SessionNotFound:
        return "SessionNotFound";
    case ErrorKind::InvalidEvent:
        return "InvalidEvent";
    case ErrorKind::Configuration:
        return "Configuration";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::HandlerFailure:
        return "HandlerFailure";
    default:
        return "Unknown";
    }
}

} // namespace surveyor
