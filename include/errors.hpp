#pragma once

#include <stdexcept>
#include <string>

/**
 * Categories of terminal failures for a download session.
 * Per-mirror transfer failures never reach the caller; they are
 * converted into "try the next mirror" inside the scheduler.
 */
enum class ErrorCode
{
    NoMirrors,           // Empty mirror list
    ConnectionError,     // A metadata probe failed to connect or returned a bad status
    InconsistentMirrors, // Mirrors disagree on length or ETag
    IOError,             // Staging file creation, resize, rename or read failure
    ExhaustedMirrors,    // Cumulative failure ceiling reached
    LocalWriteError,     // Disk failure while writing a chunk
    DigestMismatch       // Post-download checksum did not match
};

/**
 * Human-readable name for an error code (e.g. "ExhaustedMirrors").
 */
const char *errorCodeName(ErrorCode code);

/**
 * Base class for every error surfaced by the downloader.
 */
class DownloadError : public std::runtime_error
{
public:
    DownloadError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code)
    {
    }

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * Metadata probe failure for one mirror. Aborts reconciliation.
 */
class ConnectionError : public DownloadError
{
public:
    ConnectionError(const std::string &mirror, const std::string &reason);

    const std::string &mirror() const { return mirror_; }

private:
    std::string mirror_;
};

/**
 * Computed digest differs from the one supplied by the caller.
 * The downloaded file is left on disk for inspection.
 */
class DigestMismatchError : public DownloadError
{
public:
    DigestMismatchError(const std::string &expected, const std::string &computed);

    const std::string &expected() const { return expected_; }
    const std::string &computed() const { return computed_; }

private:
    std::string expected_;
    std::string computed_;
};
