#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "http_client.hpp"

/**
 * What all mirrors agreed on about the file.
 */
struct FileIdentity
{
    std::int64_t length = 0;
    std::string tag; // ETag without surrounding quotes; empty if no mirror sent one
};

struct ReconciledMetadata
{
    FileIdentity identity;
    std::string filename; // Default output name, from the first mirror's URL
};

/**
 * Probes every mirror with a HEAD request and checks they serve the same file.
 */
class MetadataReconciler
{
public:
    MetadataReconciler(HttpTransport &transport, std::chrono::milliseconds timeout);

    /**
     * Probe all mirrors concurrently and wait for every answer.
     *
     * A single unreachable mirror, non-2xx status or missing Content-Length
     * fails the whole reconciliation. Lengths must be equal; ETags must be
     * equal wherever present (a missing ETag matches anything).
     *
     * @throws DownloadError(NoMirrors) if mirrors is empty
     * @throws ConnectionError for the first failing mirror (in list order)
     * @throws DownloadError(InconsistentMirrors) on disagreement
     */
    ReconciledMetadata reconcile(const std::vector<std::string> &mirrors) const;

    /**
     * Remove one pair of surrounding double quotes, if present.
     * Safe on empty and one-character values.
     */
    static std::string stripQuotes(const std::string &etag);

private:
    HttpTransport &transport_;
    std::chrono::milliseconds timeout_;
};
