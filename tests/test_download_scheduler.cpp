#include "download_scheduler.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "multi_downloader.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <set>
#include <thread>
#include <optional>
#include <fmt/core.h>

namespace
{
    const std::chrono::milliseconds TIMEOUT{1000};

    FakeTransport::Mirror serving(const std::string &content)
    {
        FakeTransport::Mirror mirror;
        mirror.content = content;
        return mirror;
    }

    FakeTransport::Mirror down()
    {
        FakeTransport::Mirror mirror;
        mirror.up = false;
        return mirror;
    }

    // Runs one scheduler over a fresh staging file; returns the error code thrown, if any
    std::optional<ErrorCode> runSession(FakeTransport &transport,
                                        const std::vector<std::string> &mirrors,
                                        const std::filesystem::path &output,
                                        std::int64_t length,
                                        int workers,
                                        int *failures = nullptr,
                                        ProgressCallback progress = nullptr)
    {
        StagingFile file = StagingFile::create(output, length);
        DownloadScheduler scheduler(mirrors, planChunks(length, workers, static_cast<int>(mirrors.size())),
                                    file, transport, TIMEOUT);
        if (progress)
        {
            scheduler.setProgressCallback(progress);
        }
        std::optional<ErrorCode> error;
        try
        {
            scheduler.run();
        }
        catch (const DownloadError &e)
        {
            error = e.code();
        }
        if (failures)
        {
            *failures = scheduler.cumulativeFailures();
        }
        return error;
    }
}

int main()
{
    TestReport report("download scheduler");
    TempDir dir("mirrorfetch-scheduler");

    // Test 1: 10 MiB, 8 chunks, 3 healthy mirrors with random latency, through the full pipeline
    {
        std::string content = randomContent(10 * 1024 * 1024, 42);
        writeFile(dir / "reference.bin", content);

        FakeTransport transport;
        for (const char *url : {"http://a/big.bin", "http://b/big.bin", "http://c/big.bin"})
        {
            auto mirror = serving(content);
            mirror.etag = "\"v1\"";
            mirror.maxLatency = std::chrono::microseconds(200);
            transport.addMirror(url, mirror);
        }

        MultiDownloader downloader({"http://a/big.bin", "http://b/big.bin", "http://c/big.bin"},
                                   8, TIMEOUT, transport);
        const auto &chunks = downloader.gatherInfo();
        report.check(chunks.size() == 8 && downloader.fileLength() == 10 * 1024 * 1024 && downloader.etag() == "v1",
                     "Pipeline: mirrors reconciled and 8 chunks planned");
        report.check(downloader.filename() == "big.bin", "Pipeline: default filename from URL");

        auto output = dir / "big.bin";
        std::int64_t staged = downloader.setupFile(output.string());
        report.check(staged == 10 * 1024 * 1024, "Pipeline: staging file pre-sized to the full length");

        downloader.download();
        report.check(readFile(output) == content, "Pipeline: output is byte-for-byte the source");

        std::string expected = ChecksumVerifier::computeSHA256(dir / "reference.bin");
        bool verified = false;
        try
        {
            verified = downloader.verify(ChecksumVerifier::Algorithm::SHA256, expected).matches;
        }
        catch (const DigestMismatchError &e)
        {
            fmt::print("  {}\n", e.what());
        }
        report.check(verified, "Pipeline: SHA-256 of output matches the source");
        report.check(downloader.failures() == 0, "Pipeline: no failed rounds with healthy mirrors");

        // Workers fan out: every mirror served at least one range
        std::set<std::string> used;
        for (const auto &url : transport.attempts())
        {
            used.insert(url);
        }
        report.check(used.size() == 3, "Pipeline: workers start on different mirrors");
    }

    // Test 2: failover order with [A down, B up] for worker 0
    {
        std::string content = randomContent(5000, 1);
        FakeTransport transport;
        transport.addMirror("http://a/f", down());
        transport.addMirror("http://b/f", serving(content));

        auto output = dir / "failover.bin";
        int failures = -1;
        auto error = runSession(transport, {"http://a/f", "http://b/f"}, output, 5000, 1, &failures);
        auto attempts = transport.attempts();
        report.check(!error, "Failover: session succeeds");
        report.check(attempts.size() == 2 && attempts[0] == "http://a/f" && attempts[1] == "http://b/f",
                     "Failover: worker 0 tries A first, then B");
        report.check(failures == 0, "Failover: a per-mirror failure is not a cumulative failure");
        report.check(readFile(output) == content, "Failover: content came from B");
    }

    // Test 3: every mirror down, N = 3
    {
        FakeTransport transport;
        transport.addMirror("http://a/f", down());
        transport.addMirror("http://b/f", down());

        auto output = dir / "exhausted.bin";
        int failures = -1;
        auto error = runSession(transport, {"http://a/f", "http://b/f"}, output, 3000, 3, &failures);
        report.check(error == ErrorCode::ExhaustedMirrors, "Ceiling: session aborts with ExhaustedMirrors");
        report.check(failures == 3, "Ceiling: abort after exactly 3 cumulative failures");
        report.check(transport.attempts().size() == 6, "Ceiling: each worker tried each mirror once");
        report.check(!std::filesystem::exists(output), "Ceiling: final file never appears");
        report.check(std::filesystem::exists(StagingFile::makePartPath(output)), "Ceiling: staging file left behind");
    }

    // Test 4: failed workers retry on capacity freed by finished chunks
    {
        std::string content = randomContent(40000, 2);
        FakeTransport transport;
        auto flaky = serving(content);
        flaky.failFirst = 2;
        transport.addMirror("http://a/f", flaky);

        auto output = dir / "borrowed.bin";
        int failures = -1;
        auto error = runSession(transport, {"http://a/f"}, output, 40000, 4, &failures);
        report.check(!error, "Retry: session completes despite two failed rounds");
        report.check(failures == 2, "Retry: both failed rounds were counted");
        report.check(readFile(output) == content, "Retry: content intact");
    }

    // Test 5: short and oversized bodies are per-mirror failures
    {
        std::string content = randomContent(20000, 3);
        FakeTransport transport;
        auto shortBody = serving(content);
        shortBody.bodyLimit = 100;
        auto longBody = serving(content);
        longBody.extraBytes = 10;
        transport.addMirror("http://short/f", shortBody);
        transport.addMirror("http://long/f", longBody);
        transport.addMirror("http://good/f", serving(content));

        auto output = dir / "bodies.bin";
        int failures = -1;
        auto error = runSession(transport, {"http://short/f", "http://long/f", "http://good/f"},
                                output, 20000, 3, &failures);
        report.check(!error && failures == 0, "Bodies: truncated and overrunning mirrors are skipped");
        report.check(readFile(output) == content, "Bodies: nothing spilled into neighbouring chunks");
    }

    // Test 6: a server ignoring Range (200) is only accepted for a whole-file chunk
    {
        std::string content = randomContent(1000, 4);
        FakeTransport transport;
        auto ignoresRange = serving(content);
        ignoresRange.rangeStatus = 200;
        transport.addMirror("http://a/f", ignoresRange);

        auto single = dir / "single.bin";
        report.check(!runSession(transport, {"http://a/f"}, single, 1000, 1) && readFile(single) == content,
                     "Status 200: accepted when one chunk spans the file");

        auto split = dir / "split.bin";
        report.check(runSession(transport, {"http://a/f"}, split, 1000, 2) == ErrorCode::ExhaustedMirrors,
                     "Status 200: rejected for a partial range");
    }

    // Test 7: more workers than bytes
    {
        FakeTransport transport;
        transport.addMirror("http://a/f", serving("xyz"));
        auto output = dir / "tiny.bin";
        auto error = runSession(transport, {"http://a/f"}, output, 3, 5);
        report.check(!error && readFile(output) == "xyz", "Empty chunks complete without a request");
        report.check(transport.attempts().size() == 3, "Only non-empty chunks hit the network");
    }

    // Test 8: progress table and atomic commit
    {
        std::string content = randomContent(300000, 5);
        FakeTransport transport;
        auto slow = serving(content);
        slow.maxLatency = std::chrono::microseconds(100);
        transport.addMirror("http://a/f", slow);
        transport.addMirror("http://b/f", slow);

        auto output = dir / "progress.bin";
        std::vector<ProgressSnapshot> last;
        std::set<std::thread::id> callers;
        size_t calls = 0;
        bool wellFormed = true;
        bool finalHidden = true;

        auto error = runSession(transport, {"http://a/f", "http://b/f"}, output, 300000, 6, nullptr,
                                [&](const std::vector<ProgressSnapshot> &table)
                                {
                                    ++calls;
                                    callers.insert(std::this_thread::get_id());
                                    if (table.size() != 6)
                                    {
                                        wellFormed = false;
                                    }
                                    for (size_t i = 0; i < table.size(); ++i)
                                    {
                                        const auto &s = table[i];
                                        if (s.chunkId != static_cast<int>(i) || s.current < s.begin || s.current > s.end)
                                        {
                                            wellFormed = false;
                                        }
                                    }
                                    if (std::filesystem::exists(output))
                                    {
                                        finalHidden = false;
                                    }
                                    last = table;
                                });

        bool allAtEnd = last.size() == 6;
        for (const auto &s : last)
        {
            allAtEnd = allAtEnd && s.current == s.end;
        }

        report.check(!error, "Progress: session succeeds");
        report.check(calls > 0 && wellFormed, "Progress: every update carries the full ordered table");
        report.check(callers.size() == 1, "Progress: sink is always called from one thread");
        report.check(allAtEnd, "Progress: final table has every chunk at its end");
        report.check(finalHidden, "Progress: final path absent while chunks are in flight");
        report.check(readFile(output) == content, "Progress: content intact");
    }

    // Test 9: first mirror follows the worker index, whatever the chunk table was planned with
    {
        std::string content = randomContent(4000, 6);
        FakeTransport transport;
        transport.addMirror("http://a/f", serving(content));
        transport.addMirror("http://b/f", serving(content));

        auto output = dir / "spread.bin";
        StagingFile file = StagingFile::create(output, 4000);
        DownloadScheduler scheduler({"http://a/f", "http://b/f"}, planChunks(4000, 2), file, transport, TIMEOUT);
        scheduler.run();

        auto attempts = transport.attempts();
        long onB = std::count(attempts.begin(), attempts.end(), std::string("http://b/f"));
        report.check(attempts.size() == 2 && onB == 1, "Spread: worker 1 starts on mirror 1");
        report.check(readFile(output) == content, "Spread: content intact");
    }

    // Test 10: a local write error ends the session without trying another mirror
    {
        std::string content = randomContent(8000, 7);
        FakeTransport transport;
        transport.addMirror("http://a/f", serving(content));
        transport.addMirror("http://b/f", serving(content));

        // Staging file shorter than the chunk table: chunk 1 cannot be written
        auto output = dir / "short-staging.bin";
        StagingFile file = StagingFile::create(output, 4000);
        DownloadScheduler scheduler({"http://a/f", "http://b/f"}, planChunks(8000, 2, 2), file, transport, TIMEOUT);

        std::optional<ErrorCode> error;
        try
        {
            scheduler.run();
        }
        catch (const DownloadError &e)
        {
            error = e.code();
        }

        auto attempts = transport.attempts();
        long onB = std::count(attempts.begin(), attempts.end(), std::string("http://b/f"));
        report.check(error == ErrorCode::LocalWriteError, "Write error: session aborts with LocalWriteError");
        report.check(!std::filesystem::exists(output), "Write error: final file never appears");
        report.check(onB == 1 && attempts.size() <= 2, "Write error: failing chunk is not retried elsewhere");
        report.check(scheduler.cumulativeFailures() == 0, "Write error: not counted as a failed round");
    }

    // Test 11: progress keeps flowing when a chunk is retried after reaching its end
    {
        std::string content = randomContent(8192, 8);
        FakeTransport transport;
        // Whole range in one piece, then one byte too many
        auto overrun = serving(content);
        overrun.extraBytes = 1;
        overrun.pieceSize = 8192;
        transport.addMirror("http://a/f", overrun);
        transport.addMirror("http://b/f", serving(content));

        auto output = dir / "retried.bin";
        std::vector<std::int64_t> positions;
        auto error = runSession(transport, {"http://a/f", "http://b/f"}, output, 8192, 1, nullptr,
                                [&](const std::vector<ProgressSnapshot> &table)
                                { positions.push_back(table[0].current); });

        // Mirror a reaches the end and then fails; mirror b starts over
        std::vector<std::int64_t> expected{4096, 8192, 4096, 8192};
        report.check(!error && readFile(output) == content, "Retried chunk: session succeeds");
        report.check(positions == expected, "Retried chunk: sink sees every update of the second attempt");
    }

    return report.summary();
}
