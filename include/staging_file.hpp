#pragma once

#include <cstdint>
#include <filesystem>

/**
 * The pre-sized ".part" file that receives chunk data at absolute offsets.
 *
 * The file is extended to its final length before any write, so workers
 * never grow it concurrently. Each worker writes only inside its own chunk
 * and every write carries its offset (pwrite), so there is no shared
 * cursor and no lock. commit() renames it onto the final name.
 */
class StagingFile
{
public:
    /**
     * Create (or truncate) <finalPath>.part and resize it to length bytes.
     * Creates the parent directory if needed and checks free disk space.
     *
     * @throws DownloadError(IOError) on any failure
     */
    static StagingFile create(const std::filesystem::path &finalPath, std::int64_t length);

    ~StagingFile();

    // Delete copy operations (owns a file descriptor)
    StagingFile(const StagingFile &) = delete;
    StagingFile &operator=(const StagingFile &) = delete;

    StagingFile(StagingFile &&other) noexcept;
    StagingFile &operator=(StagingFile &&other) noexcept;

    /**
     * Write size bytes at an absolute offset. Safe to call from several
     * threads as long as the byte ranges do not overlap.
     *
     * @throws DownloadError(LocalWriteError) on failure
     */
    void writeAt(const char *data, size_t size, std::int64_t offset);

    /**
     * Flush, close and atomically rename the staging file to its final name.
     * May be called once.
     *
     * @throws DownloadError(IOError) on failure
     */
    void commit();

    /**
     * Current on-disk size, from fstat.
     */
    std::int64_t size() const;

    std::int64_t length() const { return length_; }
    bool committed() const { return committed_; }
    const std::filesystem::path &finalPath() const { return finalPath_; }
    const std::filesystem::path &partPath() const { return partPath_; }

    /**
     * Generate the .part filename for a destination path.
     */
    static std::filesystem::path makePartPath(const std::filesystem::path &destination);

    static constexpr const char *PART_SUFFIX = ".part";

private:
    StagingFile(std::filesystem::path finalPath, std::filesystem::path partPath, int fd, std::int64_t length);

    void close();

    std::filesystem::path finalPath_;
    std::filesystem::path partPath_;
    int fd_ = -1;
    std::int64_t length_ = 0;
    bool committed_ = false;
};

/**
 * Ensure the directory for a file path exists, creating it if needed.
 *
 * @throws DownloadError(IOError) if it cannot be created
 */
void ensureDirectoryExists(const std::filesystem::path &filePath);

/**
 * Check that the file system holding filePath has room for requiredBytes
 * plus a 10% buffer. A file system that cannot report free space only
 * produces a warning.
 *
 * @throws DownloadError(IOError) if space is insufficient
 */
void checkDiskSpace(const std::filesystem::path &filePath, std::int64_t requiredBytes);

