#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "checksum.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "format_utils.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "multi_downloader.hpp"
#include "progress_bar.hpp"

namespace
{
    // Process exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_DOWNLOAD_FAILED = 1;
    constexpr int EXIT_USAGE = 2;
    constexpr int EXIT_CHECKSUM_MISMATCH = 3;

    std::string checkUrl(const std::string &url)
    {
        if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0)
        {
            return ""; // Empty string = valid
        }
        return "URL must start with http:// or https://";
    }

    std::string checkChecksum(const std::string &checksum)
    {
        if (checksum.empty())
        {
            return "";
        }
        try
        {
            ChecksumVerifier::parseChecksum(checksum);
            return "";
        }
        catch (const std::exception &e)
        {
            return std::string("Invalid checksum format: ") + e.what();
        }
    }

    void printVersion()
    {
        fmt::print("mirrorfetch v1.0\n");
        fmt::print("Built with:\n");
        fmt::print("  - libcurl: {}\n", curl_version());
        fmt::print("  - CLI11: Command-line parsing\n");
        fmt::print("  - fmt: Modern string formatting\n");
        fmt::print("  - OpenSSL: SHA-256 / MD5 verification\n");
    }
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            printVersion();
            return EXIT_OK;
        }
    }

    CLI::App app{"mirrorfetch - parallel chunked download from several mirrors"};

    DownloadConfig config;
    std::string sha256;
    std::string md5;

    app.add_option("URL", config.urls, "HTTP/HTTPS mirrors of the same file")
        ->required()
        ->check(checkUrl);

    app.add_option("-o,--output", config.output,
                   "Output file (default: last path segment of the first URL)");

    app.add_option("-n,--connections", config.connections,
                   "Number of chunks downloaded in parallel")
        ->check(CLI::Range(1, 64))
        ->default_val(4);

    app.add_option("-t,--timeout", config.timeoutSeconds,
                   "Timeout in seconds for each request, including the whole chunk transfer")
        ->check(CLI::PositiveNumber)
        ->default_val(300);

    auto *checksumOption = app.add_option("-c,--checksum", config.expectedChecksum,
                                          "Expected checksum 'algorithm:hexhash' (sha256 or md5)")
                               ->check(checkChecksum);
    auto *sha256Option = app.add_option("--sha256", sha256, "Expected SHA-256 hex digest")
                             ->excludes(checksumOption);
    app.add_option("--md5", md5, "Expected MD5 hex digest")
        ->excludes(checksumOption)
        ->excludes(sha256Option);

    app.add_flag("-q,--quiet", config.quiet, "Do not display progress");
    app.add_flag("-V,--verbose", config.verbose, "Print diagnostics to stderr");
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        int code = app.exit(e);
        return code == 0 ? EXIT_OK : EXIT_USAGE;
    }

    std::optional<std::pair<ChecksumVerifier::Algorithm, std::string>> expected;
    try
    {
        if (config.expectedChecksum)
        {
            expected = ChecksumVerifier::parseChecksum(config.expectedChecksum.value());
        }
        else if (!sha256.empty())
        {
            expected = ChecksumVerifier::parseChecksum("sha256:" + sha256);
        }
        else if (!md5.empty())
        {
            expected = ChecksumVerifier::parseChecksum("md5:" + md5);
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ {}\n", e.what());
        return EXIT_USAGE;
    }

    logging::setVerbose(config.verbose);

    try
    {
        CurlTransport transport;
        MultiDownloader downloader(config.urls,
                                   config.connections,
                                   std::chrono::seconds(config.timeoutSeconds),
                                   transport);

        downloader.gatherInfo();
        downloader.setupFile(config.output);

        fmt::print("Downloading {} ({}) from {} {} with {} connections\n",
                   downloader.filename().string(),
                   formatBytes(downloader.fileLength()),
                   config.urls.size(),
                   config.urls.size() == 1 ? "mirror" : "mirrors",
                   config.connections);

        if (config.quiet)
        {
            downloader.download();
        }
        else
        {
            ProgressRenderer renderer(downloader.fileLength());
            try
            {
                downloader.download([&renderer](const std::vector<ProgressSnapshot> &table)
                                    { renderer.update(table); });
            }
            catch (const DownloadError &)
            {
                renderer.finish();
                throw;
            }
            renderer.finish();
        }

        fmt::print("✓ Download completed successfully");
        if (downloader.failures() > 0)
        {
            fmt::print(" (after {} failed {})", downloader.failures(),
                       downloader.failures() == 1 ? "round" : "rounds");
        }
        fmt::print("!\n");

        if (expected)
        {
            fmt::print("Verifying checksum...\n");
            VerificationResult result = downloader.verify(expected->first, expected->second);
            fmt::print("✓ Checksum verification passed! ({}:{})\n",
                       ChecksumVerifier::algorithmName(expected->first), result.computed);
        }

        return EXIT_OK;
    }
    catch (const DigestMismatchError &e)
    {
        fmt::print(stderr, "✗ Checksum verification FAILED!\n");
        fmt::print(stderr, "  Expected: {}\n", e.expected());
        fmt::print(stderr, "  Computed: {}\n", e.computed());
        fmt::print(stderr, "  File may be corrupted or incomplete.\n");
        return EXIT_CHECKSUM_MISMATCH;
    }
    catch (const DownloadError &e)
    {
        fmt::print(stderr, "✗ Download failed [{}]: {}\n", errorCodeName(e.code()), e.what());
        return EXIT_DOWNLOAD_FAILED;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return EXIT_DOWNLOAD_FAILED;
    }
}
