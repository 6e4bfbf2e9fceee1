#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>

#include "DownloadError.h"

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = 1024 * KiB;
constexpr std::uint64_t GiB = 1024 * MiB;

// How the segment layout is derived when no fixed segment size is configured.
enum class SegmentPolicy {
    TieredCount,
    TieredSize,
    CustomCount
};

using SegmentCountFn = std::function<std::uint64_t(std::uint64_t fileSize)>;

struct DownloadConfig {
    int maxRetries = 3;

    // <= 0: every segment runs in its own batch
    int maxConcurrentDownloads = 32;

    // > 0 overrides segmentPolicy
    std::int64_t fixedSegmentSizeBytes = -1;
    SegmentPolicy segmentPolicy = SegmentPolicy::TieredCount;
    SegmentCountFn customSegmentCount;

    std::size_t maxWorkerThreads = 128;

    long connectTimeoutSeconds = 30;
    long requestTimeoutSeconds = 0;

    bool verifyTotalBytes = true;
};

DownloadConfig defaultDownloadConfig();

// Size tiers at 1MB / 10MB / 100MB.
std::uint64_t tieredSegmentCount(std::uint64_t fileSize);
std::uint64_t tieredSegmentSize(std::uint64_t fileSize);

inline std::uint64_t ceilDiv(std::uint64_t a, std::uint64_t b) {
    return (a + b - 1) / b;
}

struct SegmentPlan {
    std::uint64_t fileSize = 0;
    std::uint64_t segmentCount = 0;
    std::uint64_t segmentSize = 0;
};

struct BatchReport {
    std::size_t batchIndex = 0;
    std::uint64_t bytesWritten = 0;
    std::size_t segmentsDone = 0;
    bool success = false;
    DownloadError error;
};

struct DownloadResult {
    bool success = false;
    std::uint64_t bytesWritten = 0;
    unsigned attempts = 0;
    DownloadError error;
};
