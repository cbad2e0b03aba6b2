#include "multi_downloader.hpp"

#include <stdexcept>

#include <fmt/core.h>

#include "errors.hpp"
#include "log.hpp"

MultiDownloader::MultiDownloader(std::vector<std::string> urls,
                                 int connections,
                                 std::chrono::milliseconds timeout,
                                 HttpTransport &transport)
    : urls_(std::move(urls)), connections_(connections), timeout_(timeout), transport_(transport)
{
    if (connections_ < 1)
    {
        throw std::invalid_argument(fmt::format("Number of connections must be at least 1, got {}", connections_));
    }
}

const std::vector<Chunk> &MultiDownloader::gatherInfo()
{
    MetadataReconciler reconciler(transport_, timeout_);
    ReconciledMetadata metadata = reconciler.reconcile(urls_);

    identity_ = metadata.identity;
    filename_ = metadata.filename;

    // Needed for constructing the range requests
    chunks_ = planChunks(identity_.length, connections_, static_cast<int>(urls_.size()));
    infoGathered_ = true;

    if (identity_.length < connections_)
    {
        logging::warning("File has only {} bytes for {} connections; some chunks are empty",
                         identity_.length, connections_);
    }
    return chunks_;
}

std::int64_t MultiDownloader::setupFile(const std::string &filename)
{
    if (!infoGathered_)
    {
        throw std::logic_error("setupFile() called before gatherInfo()");
    }
    if (!filename.empty())
    {
        filename_ = filename;
    }

    stagingFile_.emplace(StagingFile::create(filename_, identity_.length));
    return stagingFile_->size();
}

void MultiDownloader::download(ProgressCallback progress)
{
    if (!stagingFile_)
    {
        throw std::logic_error("download() called before setupFile()");
    }

    DownloadScheduler scheduler(urls_, chunks_, *stagingFile_, transport_, timeout_);
    if (progress)
    {
        scheduler.setProgressCallback(std::move(progress));
    }

    try
    {
        scheduler.run();
    }
    catch (const DownloadError &)
    {
        failures_ = scheduler.cumulativeFailures();
        throw;
    }
    failures_ = scheduler.cumulativeFailures();
}

VerificationResult MultiDownloader::verify(ChecksumVerifier::Algorithm algorithm, const std::string &expectedHex) const
{
    logging::verbose("Verifying {} of {}", ChecksumVerifier::algorithmName(algorithm), filename_.string());

    VerificationResult result = ChecksumVerifier::check(filename_, algorithm, expectedHex);
    if (!result.matches)
    {
        throw DigestMismatchError(ChecksumVerifier::normalizeHex(expectedHex), result.computed);
    }
    return result;
}
