#pragma once

#include <string>

enum class ErrorKind {
    None,
    // inventory
    NotFound,
    Ambiguous,
    MissingAttribute,
    InvalidAddress,
    // transport
    Unreachable,
    TimedOut,
    AuthenticationFailed,
    ProtocolError,
    // validation
    InvalidArgument,
    UnsupportedManufacturer,
    BadConfirmation,
    MissingReason,
    ConfigurationError
};

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                    return "None";
        case ErrorKind::NotFound:                return "NotFound";
        case ErrorKind::Ambiguous:               return "Ambiguous";
        case ErrorKind::MissingAttribute:        return "MissingAttribute";
        case ErrorKind::InvalidAddress:          return "InvalidAddress";
        case ErrorKind::Unreachable:             return "Unreachable";
        case ErrorKind::TimedOut:                return "TimedOut";
        case ErrorKind::AuthenticationFailed:    return "AuthenticationFailed";
        case ErrorKind::ProtocolError:           return "ProtocolError";
        case ErrorKind::InvalidArgument:         return "InvalidArgument";
        case ErrorKind::UnsupportedManufacturer: return "UnsupportedManufacturer";
        case ErrorKind::BadConfirmation:         return "BadConfirmation";
        case ErrorKind::MissingReason:           return "MissingReason";
        case ErrorKind::ConfigurationError:      return "ConfigurationError";
    }
    return "Unknown";
}
