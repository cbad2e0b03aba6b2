#include "checksum.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <fmt/core.h>

// OpenSSL EVP interface for SHA-256 and MD5
#include <openssl/evp.h>

#include "errors.hpp"

std::string ChecksumVerifier::computeDigest(const std::filesystem::path &filePath, Algorithm algorithm)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    // RAII wrapper to ensure context is freed even if exception occurs
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    const EVP_MD *md = algorithm == Algorithm::SHA256 ? EVP_sha256() : EVP_md5();
    if (EVP_DigestInit_ex(context.get(), md, nullptr) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to initialize {} digest", algorithmName(algorithm)));
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw std::runtime_error(fmt::format("Failed to update {} digest", algorithmName(algorithm)));
        }
    }

    // eof ends the loop normally; anything else is a read error
    if (file.bad())
    {
        throw DownloadError(ErrorCode::IOError,
                            fmt::format("Read error while hashing {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to finalize {} digest", algorithmName(algorithm)));
    }

    std::vector<unsigned char> hashVector(hash, hash + hashLength);
    return toHex(hashVector);
}

VerificationResult ChecksumVerifier::check(const std::filesystem::path &filePath,
                                           Algorithm algorithm,
                                           const std::string &expectedHex)
{
    VerificationResult result;
    result.computed = computeDigest(filePath, algorithm);
    result.matches = normalizeHex(expectedHex) == result.computed;
    return result;
}

void ChecksumVerifier::verify(const std::filesystem::path &filePath,
                              Algorithm algorithm,
                              const std::string &expectedHex)
{
    VerificationResult result = check(filePath, algorithm, expectedHex);
    if (!result.matches)
    {
        throw DigestMismatchError(normalizeHex(expectedHex), result.computed);
    }
}

std::pair<ChecksumVerifier::Algorithm, std::string>
ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error(
            "Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = checksumString.substr(0, colonPos);
    std::string hexHash = checksumString.substr(colonPos + 1);

    std::transform(algorithmStr.begin(), algorithmStr.end(),
                   algorithmStr.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    Algorithm algorithm;
    if (algorithmStr == "sha256")
    {
        algorithm = Algorithm::SHA256;
    }
    else if (algorithmStr == "md5")
    {
        algorithm = Algorithm::MD5;
    }
    else
    {
        throw std::runtime_error(
            fmt::format("Unsupported algorithm: '{}'", algorithmStr));
    }

    std::string normalizedHex = normalizeHex(hexHash);

    size_t expectedLength = digestHexLength(algorithm);
    if (normalizedHex.length() != expectedLength)
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        algorithmStr, expectedLength, normalizedHex.length()));
    }

    return {algorithm, normalizedHex};
}

const char *ChecksumVerifier::algorithmName(Algorithm algorithm)
{
    return algorithm == Algorithm::SHA256 ? "sha256" : "md5";
}

size_t ChecksumVerifier::digestHexLength(Algorithm algorithm)
{
    // 4 bits per hex digit
    return algorithm == Algorithm::SHA256 ? 64 : 32;
}

std::string ChecksumVerifier::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        unsigned char c = static_cast<unsigned char>(ch);

        // Skip whitespace and common separators
        if (std::isspace(c) || ch == ':' || ch == '-')
        {
            continue;
        }

        if (std::isxdigit(c))
        {
            result += static_cast<char>(std::tolower(c));
        }
        else
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}
