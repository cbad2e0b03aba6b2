#pragma once

#include <string>
#include <vector>
#include <optional> // C++17 feature for optional values

/**
 * Configuration for mirrorfetch.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct DownloadConfig
{
    // Required: every mirror of the same file, in order of preference
    std::vector<std::string> urls;

    // Output path; empty means "derive from the first URL"
    std::string output;

    int connections = 4;     // Worker count, one chunk per worker
    int timeoutSeconds = 300; // Whole-request limit, covers an entire chunk transfer

    // Checksum verification (optional)
    std::optional<std::string> expectedChecksum; // Format: "sha256:abc123..." or "md5:..."

    // Flags
    bool quiet = false;       // No progress display
    bool verbose = false;     // Verbose diagnostics on stderr
    bool showVersion = false; // Display version and exit
};
