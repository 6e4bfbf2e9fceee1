#pragma once
#include <atomic>
#include <functional>
#include <cstdint>

#include "utils.h"
#include "Segment.h"
#include "BatchQueue.h"
#include "ConnectionPool.h"
#include "../net/HttpClient.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

// Pulls batches from the queue and downloads their segments one after another.
class BatchWorker {
public:
    using ReportCallback = std::function<void(const BatchReport&)>;

    BatchWorker(BatchQueue& queue,
        ConnectionPool& pool,
        ProgressTracker& progress,
        Logger& logger,
        ReportCallback cb,
        std::atomic<bool>& stopFlag);

    void run();

    // Ranged GET for one segment; only a 206 body is written.
    bool downloadSegment(Segment& segment, HttpClient& client, std::uint64_t& bytesWritten, DownloadError& err);

private:
    BatchReport runBatch(std::size_t batchIndex, Batch& batch);

private:
    BatchQueue& batchQueue;
    ConnectionPool& connectionPool;
    ProgressTracker& progress;
    Logger& logger;
    ReportCallback report;
    std::atomic<bool>& shouldStop;
};
