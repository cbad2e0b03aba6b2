#pragma once

#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 *
 * @param bytes Number of bytes
 * @return Formatted string
 */
std::string formatBytes(std::int64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 *
 * @param seconds Duration in seconds
 * @return Formatted string, "unknown" for negative input
 */
std::string formatDuration(long seconds);

/**
 * Format a transfer rate (e.g., "1.25 MB/s")
 */
std::string formatSpeed(double bytesPerSecond);
