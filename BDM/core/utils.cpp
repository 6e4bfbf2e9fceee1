#include "utils.h"

DownloadConfig defaultDownloadConfig() {
    DownloadConfig cfg;
    cfg.maxRetries = 3;
    cfg.maxConcurrentDownloads = 32;
    cfg.fixedSegmentSizeBytes = -1;
    cfg.segmentPolicy = SegmentPolicy::TieredCount;
    return cfg;
}

std::uint64_t tieredSegmentCount(std::uint64_t fileSize) {
    if (fileSize < 1 * MiB) return 1;
    if (fileSize < 10 * MiB) return 4;
    if (fileSize < 100 * MiB) return 16;
    return 32;
}

std::uint64_t tieredSegmentSize(std::uint64_t fileSize) {
    if (fileSize < 1 * MiB) return 1 * MiB;
    if (fileSize < 10 * MiB) return 2 * MiB;
    if (fileSize < 100 * MiB) return 10 * MiB;
    return 20 * MiB;
}
