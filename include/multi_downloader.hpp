#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "checksum.hpp"
#include "chunk_planner.hpp"
#include "download_scheduler.hpp"
#include "http_client.hpp"
#include "metadata_reconciler.hpp"
#include "staging_file.hpp"

/**
 * One download session: reconcile mirrors, plan chunks, prepare the
 * staging file, download, and optionally verify.
 *
 * Typical use:
 *   MultiDownloader downloader(urls, 8, std::chrono::seconds(30), transport);
 *   downloader.gatherInfo();
 *   downloader.setupFile();
 *   downloader.download(onProgress);
 *   downloader.verify(ChecksumVerifier::Algorithm::SHA256, hex);
 */
class MultiDownloader
{
public:
    /**
     * @param urls        Mirrors of the same file
     * @param connections Worker count (>= 1)
     * @param timeout     Per-request timeout
     * @param transport   HTTP implementation, must outlive the downloader
     * @throws std::invalid_argument if connections < 1
     */
    MultiDownloader(std::vector<std::string> urls,
                    int connections,
                    std::chrono::milliseconds timeout,
                    HttpTransport &transport);

    /**
     * Probe all mirrors and build the chunk table.
     * @return the chunk table (one chunk per connection)
     */
    const std::vector<Chunk> &gatherInfo();

    /**
     * Create the pre-sized staging file.
     *
     * @param filename Output path; empty keeps the name derived from the URL
     * @return size of the staging file on disk
     */
    std::int64_t setupFile(const std::string &filename = "");

    /**
     * Run the scheduler; on success the output file exists under its final name.
     */
    void download(ProgressCallback progress = nullptr);

    /**
     * Check the finished file against an expected digest.
     * @throws DigestMismatchError on mismatch
     */
    VerificationResult verify(ChecksumVerifier::Algorithm algorithm, const std::string &expectedHex) const;

    std::int64_t fileLength() const { return identity_.length; }
    const std::string &etag() const { return identity_.tag; }
    const std::filesystem::path &filename() const { return filename_; }
    std::filesystem::path partFilename() const { return StagingFile::makePartPath(filename_); }
    const std::vector<Chunk> &chunks() const { return chunks_; }
    int connections() const { return connections_; }
    int failures() const { return failures_; }

private:
    std::vector<std::string> urls_;
    int connections_;
    std::chrono::milliseconds timeout_;
    HttpTransport &transport_;

    FileIdentity identity_;
    std::filesystem::path filename_;
    std::vector<Chunk> chunks_;
    std::optional<StagingFile> stagingFile_;
    bool infoGathered_ = false;
    int failures_ = 0;
};
