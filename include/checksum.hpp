#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

/**
 * Outcome of comparing a file's digest against an expected value.
 */
struct VerificationResult
{
    bool matches = false;
    std::string computed; // Lowercase hex digest of the file
};

/**
 * File integrity verification using cryptographic hashes.
 * Supports SHA-256 and MD5.
 */
class ChecksumVerifier
{
public:
    /**
     * Supported hash algorithms.
     */
    enum class Algorithm
    {
        SHA256,
        MD5
    };

    /**
     * Compute the digest of a file.
     * Reads file in chunks to avoid loading entire file into memory.
     *
     * @param filePath Path to file to hash
     * @param algorithm Digest to use
     * @return Lowercase hex digest (64 characters for SHA-256, 32 for MD5)
     * @throws DownloadError(IOError) if file cannot be read
     */
    static std::string computeDigest(const std::filesystem::path &filePath, Algorithm algorithm);

    static std::string computeSHA256(const std::filesystem::path &filePath)
    {
        return computeDigest(filePath, Algorithm::SHA256);
    }

    static std::string computeMD5(const std::filesystem::path &filePath)
    {
        return computeDigest(filePath, Algorithm::MD5);
    }

    /**
     * Compare a file's digest with an expected hex string.
     * Case and whitespace in expectedHex are ignored.
     */
    static VerificationResult check(const std::filesystem::path &filePath,
                                    Algorithm algorithm,
                                    const std::string &expectedHex);

    /**
     * Same as check(), but a mismatch is an error.
     *
     * @throws DigestMismatchError with both digests on mismatch
     */
    static void verify(const std::filesystem::path &filePath,
                       Algorithm algorithm,
                       const std::string &expectedHex);

    /**
     * Parse checksum string into algorithm and hash.
     * Format: "algorithm:hexhash"
     *
     * @param checksumStr Input string (e.g., "sha256:abc123...")
     * @return Pair of (algorithm, normalized hex hash)
     * @throws std::runtime_error if format is invalid
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumStr);

    /**
     * "sha256" or "md5".
     */
    static const char *algorithmName(Algorithm algorithm);

    /**
     * Convert hex string to lowercase and remove whitespace.
     * Makes comparison case-insensitive.
     *
     * @throws std::runtime_error on a non-hex character
     */
    static std::string normalizeHex(const std::string &hex);

private:
    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const std::vector<unsigned char> &data);

    static size_t digestHexLength(Algorithm algorithm);

    // Chunk size for file reading (1 MB)
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};
