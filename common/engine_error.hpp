#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

// Job-level failure kinds. Per-file problems are recorded on the FileItem,
// they are only described with an EngineError while being captured.
enum class ErrorKind {
    SourceNotFound,
    SourceAccessDenied,
    DestinationAccessDenied,
    ReadError,
    WriteError,
    PathTooLong,
    InvalidPath,
    EnumerationFailed,
    DirectoryCreationFailed,
    InvalidState,
    UnsupportedAlgorithm,
    Unknown
};

struct EngineError {
    ErrorKind kind = ErrorKind::Unknown;
    std::filesystem::path path;
    std::optional<int> osError;   // errno value when the OS reported one
    std::string reason;

    EngineError() = default;
    EngineError(ErrorKind k, std::filesystem::path p, std::string why = "")
        : kind(k), path(std::move(p)), reason(std::move(why)) {}

    static EngineError fromErrorCode(ErrorKind k, const std::filesystem::path& p, const std::error_code& ec);
    static EngineError fromErrno(ErrorKind k, const std::filesystem::path& p, int err);

    std::string toString() const;
};

const char* errorKindName(ErrorKind kind);
