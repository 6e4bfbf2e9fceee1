#include "DownloadOrchestrator.h"

#include <thread>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <utility>

DownloadOrchestrator::DownloadOrchestrator(DownloadConfig config,
    std::string u,
    RandomAccessWriter& w,
    HttpClientFactory clientFactory,
    Logger& log)
    : cfg(std::move(config)),
    url(std::move(u)),
    writer(w),
    makeClient(std::move(clientFactory)),
    logger(log),
    planner(cfg),
    progress(0)
{
}

unsigned DownloadOrchestrator::maxAttempts() const {
    return cfg.maxRetries > 0 ? static_cast<unsigned>(cfg.maxRetries) : 1u;
}

DownloadResult DownloadOrchestrator::run() {
    DownloadResult result{};

    std::uint64_t fileSize = 0;
    if (!discoverSize(fileSize, result.error))
        return result;

    logger.log("File size: " + std::to_string(fileSize));

    const unsigned attempts = maxAttempts();
    const auto startTime = std::chrono::steady_clock::now();

    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        result.attempts = attempt;

        std::uint64_t written = 0;
        DownloadError err;
        if (runAttempt(fileSize, written, err)) {
            result.success = true;
            result.bytesWritten = written;
            result.error = DownloadError();
            break;
        }

        logger.log(LogLevel::Warn, "Attempt " + std::to_string(attempt) + "/" +
            std::to_string(attempts) + " failed: " + err.message());
        result.error = std::move(err);
    }

    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;
    const double avgSpeed = duration.count() > 0
        ? static_cast<double>(result.bytesWritten) / duration.count()
        : 0.0;

    std::ostringstream conclusion;
    conclusion << "Download "
        << (result.success ? "completed" : "failed")
        << " in " << std::fixed << std::setprecision(2)
        << duration.count() << "s, avg speed "
        << std::setprecision(2) << (avgSpeed * 8.0 / 1'000'000.0)
        << " Mbps, threads " << workerCount
        << ", segments " << progress.segments() << "/" << plannedSegments
        << ", attempts " << result.attempts << "/" << attempts;
    logger.log(result.success ? LogLevel::Info : LogLevel::Error, conclusion.str());

    if (!result.success) {
        result.error.wrap("giving up after " + std::to_string(result.attempts) + " attempts")
            .withAttempts(result.attempts);
    }

    return result;
}

bool DownloadOrchestrator::discoverSize(std::uint64_t& fileSize, DownloadError& err) {
    fileSize = 0;

    auto client = makeClient(url);
    if (!client) {
        err = DownloadError(ErrorKind::Transport, "no HTTP client available");
        err.wrap("failed to get file size of file at " + url);
        return false;
    }

    HttpHeadResult head{};
    if (!client->head(head)) {
        err = DownloadError(ErrorKind::Transport, head.error);
        err.wrap("failed to get content length of file at " + url);
        err.wrap("failed to get file size of file at " + url);
        return false;
    }

    if (head.status < 200 || head.status >= 300) {
        const ErrorKind kind = classifyDiscoveryStatus(head.status);
        std::string cause;
        switch (kind) {
        case ErrorKind::NotFound:
            cause = "file not found at " + url;
            break;
        case ErrorKind::Forbidden:
            cause = "access denied to file at " + url;
            break;
        case ErrorKind::Unauthorized:
            cause = "unauthorized to access file at " + url;
            break;
        case ErrorKind::RangeNotSatisfiable:
            cause = "requested range not satisfiable for file at " + url;
            break;
        default:
            cause = "failed to get content length of file at " + url +
                "; status code: " + std::to_string(head.status);
            break;
        }
        err = DownloadError(kind, cause);
        err.withStatus(head.status);
        err.wrap("failed to get file size of file at " + url);
        return false;
    }

    if (!head.hasContentLength || head.contentLength == 0) {
        err = DownloadError(ErrorKind::InvalidSize, head.hasContentLength
            ? "server reported a content length of 0"
            : "server did not report a content length");
        err.withStatus(head.status);
        err.wrap("failed to get file size of file at " + url);
        return false;
    }

    if (!head.acceptRanges)
        logger.log(LogLevel::Debug, "Server does not advertise Accept-Ranges: bytes");
    if (!head.etag.empty())
        logger.log(LogLevel::Debug, "ETag: " + head.etag);

    fileSize = head.contentLength;
    return true;
}

bool DownloadOrchestrator::runAttempt(std::uint64_t fileSize, std::uint64_t& bytesWritten, DownloadError& err) {
    bytesWritten = 0;
    plannedSegments = 0;

    SegmentPlan plan;
    if (!planner.determineSegmentCount(fileSize, plan, err)) {
        err.wrap("failed to plan segments for " + std::to_string(fileSize) + " bytes");
        return false;
    }

    std::vector<Batch> batches = planner.partitionIntoBatches(planner.createSegments(plan, writer));
    plannedSegments = plan.segmentCount;

    logger.log("Downloading " + std::to_string(plan.segmentCount) + " segments of " +
        std::to_string(plan.segmentSize) + " bytes in " + std::to_string(batches.size()) + " batches");

    {
        std::lock_guard<std::mutex> lock(reportMutex);
        attemptBytes = 0;
        attemptFailed = false;
        attemptError = DownloadError();
    }
    progress.reset(fileSize);
    stopFlag.store(false);

    workerCount = workerCountFor(batches.size());

    BatchQueue queue(batches);
    ConnectionPool connectionPool(url, workerCount, makeClient);
    {
        ThreadPool threadPool(stopFlag);

        auto workerFn = [this, &queue, &connectionPool]() {
            BatchWorker worker(
                queue,
                connectionPool,
                progress,
                logger,
                [this](const BatchReport& rep) {
                    onBatchReport(rep);
                },
                stopFlag
            );

            worker.run();
            };

        threadPool.start(workerCount, workerFn);

        waitForBatches(queue);
        threadPool.join();
    }

    if (const std::size_t failed = queue.failedCount()) {
        logger.log(LogLevel::Warn, std::to_string(failed) + " of " + std::to_string(queue.size()) +
            " batches failed");
    }

    std::lock_guard<std::mutex> lock(reportMutex);
    if (attemptFailed) {
        err = attemptError;
        return false;
    }

    if (cfg.verifyTotalBytes && attemptBytes != fileSize) {
        err = DownloadError(ErrorKind::Integrity, "wrote " + std::to_string(attemptBytes) +
            " bytes, expected " + std::to_string(fileSize));
        return false;
    }

    bytesWritten = attemptBytes;
    return true;
}

// All batches are awaited, a failed batch does not stop its siblings.
void DownloadOrchestrator::waitForBatches(const BatchQueue& queue) {
    auto lastProgressLog = std::chrono::steady_clock::now();

    while (!queue.allFinished()) {
        auto now = std::chrono::steady_clock::now();
        if (now - lastProgressLog >= std::chrono::seconds(1)) {
            std::ostringstream os;
            os << "Progress: " << progress.describe()
                << ", segments " << progress.segments()
                << ", " << std::fixed << std::setprecision(2)
                << (progress.speedBytesPerSec() * 8.0 / 1'000'000.0) << " Mbps";
            logger.log(os.str());
            lastProgressLog = now;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

std::size_t DownloadOrchestrator::workerCountFor(std::size_t batchCount) const {
    std::size_t limit = cfg.maxWorkerThreads;
    if (limit == 0) {
        std::size_t hw = std::thread::hardware_concurrency();
        if (hw == 0) hw = 4;
        limit = std::clamp<std::size_t>(hw * 2, 2, 32);
    }

    return std::max<std::size_t>(1, std::min(limit, batchCount));
}

void DownloadOrchestrator::onBatchReport(const BatchReport& report) {
    std::lock_guard<std::mutex> lock(reportMutex);
    if (report.success) {
        attemptBytes += report.bytesWritten;
        return;
    }

    // the first failure of an attempt is the one surfaced
    if (!attemptFailed) {
        attemptFailed = true;
        attemptError = report.error;
    }
}
