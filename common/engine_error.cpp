#include "engine_error.hpp"
#include <cstring>

EngineError EngineError::fromErrorCode(ErrorKind k, const std::filesystem::path& p, const std::error_code& ec) {
    EngineError err(k, p, ec.message());
    if (ec) err.osError = ec.value();
    return err;
}

EngineError EngineError::fromErrno(ErrorKind k, const std::filesystem::path& p, int errnum) {
    EngineError err(k, p);
    if (errnum != 0) {
        err.osError = errnum;
        err.reason = std::strerror(errnum);
    }
    return err;
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceNotFound:          return "SourceNotFound";
        case ErrorKind::SourceAccessDenied:      return "SourceAccessDenied";
        case ErrorKind::DestinationAccessDenied: return "DestinationAccessDenied";
        case ErrorKind::ReadError:               return "ReadError";
        case ErrorKind::WriteError:              return "WriteError";
        case ErrorKind::PathTooLong:             return "PathTooLong";
        case ErrorKind::InvalidPath:             return "InvalidPath";
        case ErrorKind::EnumerationFailed:       return "EnumerationFailed";
        case ErrorKind::DirectoryCreationFailed: return "DirectoryCreationFailed";
        case ErrorKind::InvalidState:            return "InvalidState";
        case ErrorKind::UnsupportedAlgorithm:    return "UnsupportedAlgorithm";
        case ErrorKind::Unknown:                 return "Unknown";
    }
    return "Unknown";
}

std::string EngineError::toString() const {
    std::string msg;
    switch (kind) {
        case ErrorKind::SourceNotFound:          msg = "Source directory not found: "; break;
        case ErrorKind::SourceAccessDenied:      msg = "Source directory access denied: "; break;
        case ErrorKind::DestinationAccessDenied: msg = "Destination directory access denied: "; break;
        case ErrorKind::ReadError:               msg = "Failed to read file: "; break;
        case ErrorKind::WriteError:              msg = "Failed to write file: "; break;
        case ErrorKind::PathTooLong:             msg = "Path exceeds maximum length: "; break;
        case ErrorKind::InvalidPath:             msg = "Invalid path: "; break;
        case ErrorKind::EnumerationFailed:       msg = "Failed to enumerate directory: "; break;
        case ErrorKind::DirectoryCreationFailed: msg = "Failed to create directory: "; break;
        case ErrorKind::InvalidState:            msg = "Invalid job state: "; break;
        case ErrorKind::UnsupportedAlgorithm:    msg = "Unsupported checksum algorithm: "; break;
        case ErrorKind::Unknown:                 msg = "Engine error: "; break;
    }
    msg += path.string();
    if (!reason.empty())
        msg += " (" + reason + ")";
    return msg;
}
