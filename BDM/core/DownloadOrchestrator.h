#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <cstddef>
#include <cstdint>

#include "utils.h"
#include "BatchPlanner.h"
#include "BatchQueue.h"
#include "BatchWorker.h"
#include "ConnectionPool.h"
#include "ThreadPool.h"
#include "../io/RandomAccessWriter.h"
#include "../net/HttpClient.h"
#include "../monitor/ProgressTracker.h"
#include "../monitor/Logger.h"

// Runs one download: size discovery, then up to maxRetries attempts of
// plan + concurrent batch execution. Every attempt starts from a fresh plan.
class DownloadOrchestrator {
public:
    DownloadOrchestrator(DownloadConfig config,
        std::string url,
        RandomAccessWriter& writer,
        HttpClientFactory clientFactory,
        Logger& logger);

    DownloadResult run();

    bool discoverSize(std::uint64_t& fileSize, DownloadError& err);
    bool runAttempt(std::uint64_t fileSize, std::uint64_t& bytesWritten, DownloadError& err);

    unsigned maxAttempts() const;

private:
    void onBatchReport(const BatchReport& report);
    std::size_t workerCountFor(std::size_t batchCount) const;
    void waitForBatches(const BatchQueue& queue);

private:
    DownloadConfig cfg;
    std::string url;
    RandomAccessWriter& writer;
    HttpClientFactory makeClient;
    Logger& logger;

    BatchPlanner planner;
    ProgressTracker progress;
    std::atomic<bool> stopFlag{ false };

    std::mutex reportMutex;
    std::uint64_t attemptBytes{ 0 };
    bool attemptFailed{ false };
    DownloadError attemptError;
    std::size_t workerCount{ 0 };
    std::uint64_t plannedSegments{ 0 };
};
