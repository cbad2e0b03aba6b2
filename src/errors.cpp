#include "errors.hpp"

#include <fmt/core.h>

const char *errorCodeName(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::NoMirrors:
        return "NoMirrors";
    case ErrorCode::ConnectionError:
        return "ConnectionError";
    case ErrorCode::InconsistentMirrors:
        return "InconsistentMirrors";
    case ErrorCode::IOError:
        return "IOError";
    case ErrorCode::ExhaustedMirrors:
        return "ExhaustedMirrors";
    case ErrorCode::LocalWriteError:
        return "LocalWriteError";
    case ErrorCode::DigestMismatch:
        return "DigestMismatch";
    }
    return "Unknown";
}

ConnectionError::ConnectionError(const std::string &mirror, const std::string &reason)
    : DownloadError(ErrorCode::ConnectionError,
                    fmt::format("Failed connection to URL {}: {}", mirror, reason)),
      mirror_(mirror)
{
}

DigestMismatchError::DigestMismatchError(const std::string &expected, const std::string &computed)
    : DownloadError(ErrorCode::DigestMismatch,
                    fmt::format("Computed digest does not match: provided={} computed={}",
                                expected, computed)),
      expected_(expected),
      computed_(computed)
{
}
