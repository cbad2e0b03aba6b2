#include "metadata_reconciler.hpp"

#include <future>

#include <fmt/core.h>

#include "errors.hpp"
#include "log.hpp"

MetadataReconciler::MetadataReconciler(HttpTransport &transport, std::chrono::milliseconds timeout)
    : transport_(transport), timeout_(timeout)
{
}

std::string MetadataReconciler::stripQuotes(const std::string &etag)
{
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"')
    {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

ReconciledMetadata MetadataReconciler::reconcile(const std::vector<std::string> &mirrors) const
{
    if (mirrors.empty())
    {
        throw DownloadError(ErrorCode::NoMirrors, "No URLs provided");
    }

    // Connect to all sources concurrently
    std::vector<std::future<HeadResponse>> probes;
    probes.reserve(mirrors.size());
    for (const auto &mirror : mirrors)
    {
        probes.push_back(std::async(std::launch::async, [this, &mirror]()
                                    { return transport_.head(mirror, timeout_); }));
    }

    // Every probe is collected before any verdict, so no thread outlives this call
    std::vector<HeadResponse> responses;
    responses.reserve(probes.size());
    for (auto &probe : probes)
    {
        responses.push_back(probe.get());
    }

    for (size_t i = 0; i < mirrors.size(); ++i)
    {
        const HeadResponse &r = responses[i];
        if (!r.connected)
        {
            throw ConnectionError(mirrors[i], r.error.empty() ? "no response" : r.error);
        }
        if (r.statusCode < 200 || r.statusCode >= 300)
        {
            throw ConnectionError(mirrors[i],
                                  fmt::format("HTTP status {} ({})", r.statusCode, httpStatusText(r.statusCode)));
        }
        if (r.contentLength < 0)
        {
            throw ConnectionError(mirrors[i], "no Content-Length in response");
        }
        logging::verbose("Mirror {}: {} bytes, ETag {}", mirrors[i], r.contentLength,
                         r.etag.empty() ? "(none)" : r.etag);
    }

    // All sources must agree on file length; present ETags must agree with each other
    FileIdentity identity;
    identity.length = responses[0].contentLength;
    for (size_t i = 0; i < responses.size(); ++i)
    {
        const HeadResponse &r = responses[i];
        if (r.contentLength != identity.length)
        {
            throw DownloadError(ErrorCode::InconsistentMirrors,
                                fmt::format("URLs must point to the same file: {} reports {} bytes, {} reports {}",
                                            mirrors[0], identity.length, mirrors[i], r.contentLength));
        }

        std::string tag = stripQuotes(r.etag);
        if (tag.empty())
        {
            continue;
        }
        if (identity.tag.empty())
        {
            identity.tag = tag;
        }
        else if (tag != identity.tag)
        {
            throw DownloadError(ErrorCode::InconsistentMirrors,
                                fmt::format("URLs must point to the same file: ETag \"{}\" differs from \"{}\" ({})",
                                            tag, identity.tag, mirrors[i]));
        }
    }

    ReconciledMetadata metadata;
    metadata.identity = identity;
    metadata.filename = urlToFilename(mirrors[0]);

    logging::verbose("File length: {} bytes", identity.length);
    logging::verbose("File name: {}", metadata.filename);
    logging::verbose("ETag: {}", identity.tag.empty() ? "(none)" : identity.tag);

    return metadata;
}
