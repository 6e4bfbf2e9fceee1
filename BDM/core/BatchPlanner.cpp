#include "BatchPlanner.h"

#include <algorithm>
#include <utility>
#include <iterator>

BatchPlanner::BatchPlanner(DownloadConfig config)
    : cfg(std::move(config)) {
}

bool BatchPlanner::determineSegmentCount(std::uint64_t fileSize, SegmentPlan& out, DownloadError& err) const {
    out = SegmentPlan{};
    out.fileSize = fileSize;

    if (fileSize == 0) {
        err = DownloadError(ErrorKind::InvalidSize, "cannot plan segments for an empty file");
        return false;
    }

    if (cfg.fixedSegmentSizeBytes > 0) {
        out.segmentSize = static_cast<std::uint64_t>(cfg.fixedSegmentSizeBytes);
        out.segmentCount = ceilDiv(fileSize, out.segmentSize);
        return true;
    }

    switch (cfg.segmentPolicy) {
    case SegmentPolicy::TieredCount:
        out.segmentCount = tieredSegmentCount(fileSize);
        break;
    case SegmentPolicy::TieredSize:
        // same layout as a fixed size: the last range may run past the end
        out.segmentSize = tieredSegmentSize(fileSize);
        out.segmentCount = ceilDiv(fileSize, out.segmentSize);
        return true;
    case SegmentPolicy::CustomCount:
        if (!cfg.customSegmentCount) {
            err = DownloadError(ErrorKind::InvalidConfig, "custom segment count policy has no function");
            return false;
        }
        out.segmentCount = cfg.customSegmentCount(fileSize);
        break;
    }

    if (out.segmentCount == 0) {
        err = DownloadError(ErrorKind::InvalidConfig, "segment policy produced zero segments");
        return false;
    }

    // more segments than bytes would leave empty ranges
    if (out.segmentCount > fileSize)
        out.segmentCount = fileSize;

    out.segmentSize = ceilDiv(fileSize, out.segmentCount);
    return true;
}

std::vector<Segment> BatchPlanner::createSegments(const SegmentPlan& plan, RandomAccessWriter& writer) const {
    std::vector<Segment> segments;
    segments.reserve(plan.segmentCount);

    for (std::uint64_t i = 0; i < plan.segmentCount; ++i) {
        segments.emplace_back(writer, i * plan.segmentSize, plan.segmentSize);
    }

    return segments;
}

std::vector<Batch> BatchPlanner::partitionIntoBatches(std::vector<Segment> segments) const {
    std::vector<Batch> batches;

    const std::size_t n = segments.size();
    if (cfg.maxConcurrentDownloads <= 0 || n <= static_cast<std::size_t>(cfg.maxConcurrentDownloads)) {
        batches.reserve(n);
        for (auto& seg : segments)
            batches.push_back(Batch{ std::move(seg) });
        return batches;
    }

    const std::size_t perBatch = static_cast<std::size_t>(
        ceilDiv(n, static_cast<std::uint64_t>(cfg.maxConcurrentDownloads)));

    for (std::size_t i = 0; i < n; i += perBatch) {
        const std::size_t end = std::min(n, i + perBatch);
        batches.emplace_back(std::make_move_iterator(segments.begin() + i),
            std::make_move_iterator(segments.begin() + end));
    }

    return batches;
}
