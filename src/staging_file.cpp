#include "staging_file.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "errors.hpp"
#include "format_utils.hpp"
#include "log.hpp"

StagingFile::StagingFile(std::filesystem::path finalPath, std::filesystem::path partPath, int fd, std::int64_t length)
    : finalPath_(std::move(finalPath)), partPath_(std::move(partPath)), fd_(fd), length_(length)
{
}

StagingFile StagingFile::create(const std::filesystem::path &finalPath, std::int64_t length)
{
    ensureDirectoryExists(finalPath);
    checkDiskSpace(finalPath, length);

    std::filesystem::path partPath = makePartPath(finalPath);

    int fd = ::open(partPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Cannot open file for writing: {}: {}", partPath.string(), std::strerror(errno)));
    }

    // From here on the descriptor is owned (and closed) by the object
    StagingFile file(finalPath, partPath, fd, length);

    // Force the final size so chunks can be written in any order
    if (::ftruncate(fd, static_cast<off_t>(length)) != 0)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Cannot resize {} to {} bytes: {}", partPath.string(), length, std::strerror(errno)));
    }

    if (file.size() != length)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Staging file {} has {} bytes after resize, expected {}",
                                        partPath.string(), file.size(), length));
    }

    logging::verbose("Parts file name: {} ({})", partPath.string(), formatBytes(length));
    return file;
}

StagingFile::~StagingFile()
{
    close();
}

StagingFile::StagingFile(StagingFile &&other) noexcept
    : finalPath_(std::move(other.finalPath_)),
      partPath_(std::move(other.partPath_)),
      fd_(std::exchange(other.fd_, -1)),
      length_(other.length_),
      committed_(other.committed_)
{
}

StagingFile &StagingFile::operator=(StagingFile &&other) noexcept
{
    if (this != &other)
    {
        close();
        finalPath_ = std::move(other.finalPath_);
        partPath_ = std::move(other.partPath_);
        fd_ = std::exchange(other.fd_, -1);
        length_ = other.length_;
        committed_ = other.committed_;
    }
    return *this;
}

void StagingFile::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

void StagingFile::writeAt(const char *data, size_t size, std::int64_t offset)
{
    if (fd_ < 0)
    {
        throw DownloadError(ErrorCode::LocalWriteError,
                            fmt::format("Write to closed staging file {}", partPath_.string()));
    }
    if (offset < 0 || offset + static_cast<std::int64_t>(size) > length_)
    {
        throw DownloadError(ErrorCode::LocalWriteError,
                            fmt::format("Write of {} bytes at offset {} exceeds file length {}", size, offset, length_));
    }

    // pwrite may write less than asked; keep going until the block is on disk
    while (size > 0)
    {
        ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw DownloadError(ErrorCode::LocalWriteError,
                                fmt::format("Write to {} at offset {} failed: {}",
                                            partPath_.string(), offset, std::strerror(errno)));
        }
        data += written;
        size -= static_cast<size_t>(written);
        offset += written;
    }
}

void StagingFile::commit()
{
    if (committed_)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Staging file {} was already committed", partPath_.string()));
    }

    if (fd_ >= 0)
    {
        if (::fsync(fd_) != 0)
        {
            logging::warning("fsync of {} failed: {}", partPath_.string(), std::strerror(errno));
        }
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0)
        {
            throw DownloadError(ErrorCode::IOError,
                                fmt::format("Closing {} failed: {}", partPath_.string(), std::strerror(errno)));
        }
    }

    // Rename .part to final filename (atomic on the same file system)
    try
    {
        std::filesystem::rename(partPath_, finalPath_);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Download succeeded but failed to rename {} to {}: {}",
                                        partPath_.string(), finalPath_.string(), e.what()));
    }
    committed_ = true;
}

std::int64_t StagingFile::size() const
{
    struct stat info;
    if (fd_ >= 0)
    {
        if (::fstat(fd_, &info) != 0)
        {
            throw DownloadError(ErrorCode::IOError,
                                fmt::format("Cannot stat {}: {}", partPath_.string(), std::strerror(errno)));
        }
        return static_cast<std::int64_t>(info.st_size);
    }

    const std::filesystem::path &current = committed_ ? finalPath_ : partPath_;
    std::error_code ec;
    auto onDisk = std::filesystem::file_size(current, ec);
    if (ec)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Cannot stat {}: {}", current.string(), ec.message()));
    }
    return static_cast<std::int64_t>(onDisk);
}

std::filesystem::path StagingFile::makePartPath(const std::filesystem::path &destination)
{
    // Simply append ".part" to the filename
    std::filesystem::path partPath = destination;
    partPath += PART_SUFFIX;
    return partPath;
}

void ensureDirectoryExists(const std::filesystem::path &filePath)
{
    auto directory = filePath.parent_path();

    // If parent directory is empty (file in current dir), nothing to create
    if (directory.empty())
    {
        return;
    }

    try
    {
        if (!std::filesystem::exists(directory))
        {
            std::filesystem::create_directories(directory);
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Failed to create directory for {}: {}", filePath.string(), e.what()));
    }
}

void checkDiskSpace(const std::filesystem::path &filePath, std::int64_t requiredBytes)
{
    if (requiredBytes <= 0)
    {
        return;
    }

    auto directory = filePath.parent_path();
    if (directory.empty())
    {
        directory = ".";
    }

    std::error_code ec;
    auto spaceInfo = std::filesystem::space(directory, ec);
    if (ec)
    {
        // Some file systems don't support space queries
        logging::warning("Unable to check disk space: {}", ec.message());
        return;
    }

    // Some filesystems reserve space, keep 10% headroom
    std::int64_t requiredWithBuffer = requiredBytes + (requiredBytes / 10);
    if (spaceInfo.available < static_cast<std::uintmax_t>(requiredWithBuffer))
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Insufficient disk space: need {} (+ 10% buffer) but only {} available",
                                        formatBytes(requiredBytes),
                                        formatBytes(static_cast<std::int64_t>(spaceInfo.available))));
    }
}
