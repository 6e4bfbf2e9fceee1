#pragma once
#include <vector>
#include <cstdint>

#include "utils.h"
#include "Segment.h"
#include "DownloadError.h"

using Batch = std::vector<Segment>;

class BatchPlanner {
public:
    explicit BatchPlanner(DownloadConfig config);

    // Fixed segment size when configured, otherwise count from segmentPolicy
    // and size derived from the count.
    bool determineSegmentCount(std::uint64_t fileSize, SegmentPlan& out, DownloadError& err) const;

    std::vector<Segment> createSegments(const SegmentPlan& plan, RandomAccessWriter& writer) const;

    // Singleton batches when maxConcurrentDownloads <= 0 or there are no more
    // segments than that, else contiguous chunks of ceil(n / max).
    std::vector<Batch> partitionIntoBatches(std::vector<Segment> segments) const;

private:
    DownloadConfig cfg;
};
