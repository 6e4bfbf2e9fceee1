#include "BatchWorker.h"

#include <string>
#include <utility>

BatchWorker::BatchWorker(BatchQueue& queue,
    ConnectionPool& pool,
    ProgressTracker& tracker,
    Logger& log,
    ReportCallback cb,
    std::atomic<bool>& stopFlag)
    : batchQueue(queue),
    connectionPool(pool),
    progress(tracker),
    logger(log),
    report(std::move(cb)),
    shouldStop(stopFlag) {
}

void BatchWorker::run() {
    while (!shouldStop.load(std::memory_order_relaxed)) {

        auto next = batchQueue.getNext();
        if (!next.has_value())
            return;

        const std::size_t index = *next;
        BatchReport rep = runBatch(index, batchQueue.at(index));

        batchQueue.finish(index, rep.success);
        report(rep);
    }
}

BatchReport BatchWorker::runBatch(std::size_t batchIndex, Batch& batch) {
    BatchReport rep{};
    rep.batchIndex = batchIndex;
    rep.success = true;

    for (auto& segment : batch) {
        std::uint64_t written = 0;

        // Get connection
        auto client = connectionPool.acquire();
        bool ok = false;
        if (client)
            ok = downloadSegment(segment, *client, written, rep.error);
        else
            rep.error = DownloadError(ErrorKind::Transport, "no HTTP client available");
        connectionPool.release(std::move(client));

        if (!ok) {
            rep.success = false;
            rep.error.wrap("failed to download batch " + std::to_string(batchIndex));
            break;
        }

        rep.bytesWritten += written;
        ++rep.segmentsDone;
        progress.segmentDone();
    }

    return rep;
}

bool BatchWorker::downloadSegment(Segment& segment, HttpClient& client, std::uint64_t& bytesWritten, DownloadError& err) {
    bytesWritten = 0;

    const std::string range = segment.rangeHeaderValue();
    const std::string context = "failed to download part " + range;
    logger.log(LogLevel::Debug, "Downloading part with range " + range);

    HttpRangeResult res;
    if (!client.getRange(range, res)) {
        err = DownloadError(ErrorKind::Transport, res.error);
        err.wrap(context).withRange(segment.startOffset(), segment.length());
        return false;
    }

    if (res.status == 200) {
        err = DownloadError(ErrorKind::RangeUnsupported, "server does not support range requests");
        err.wrap(context).withStatus(res.status).withRange(segment.startOffset(), segment.length());
        return false;
    }

    if (res.status != 206) {
        err = DownloadError(ErrorKind::UnexpectedStatus, "status code: " + std::to_string(res.status));
        err.wrap(context).withStatus(res.status).withRange(segment.startOffset(), segment.length());
        return false;
    }

    // a body longer than the segment is cut off by Segment::write
    std::size_t pos = 0;
    while (pos < res.body.size() && !segment.complete()) {
        std::size_t n = 0;
        if (!segment.write(res.body.data() + pos, res.body.size() - pos, n, err)) {
            err.wrap(context);
            return false;
        }

        if (n == 0) {
            const std::uint64_t offset = segment.writeOffset();
            err = DownloadError(ErrorKind::WriteFailed, "writer accepted no bytes");
            err.wrap("failed to write to file at offset " + std::to_string(offset) +
                "; size: " + std::to_string(res.body.size() - pos))
                .withRange(offset, res.body.size() - pos);
            err.wrap(context);
            return false;
        }

        pos += n;
        bytesWritten += n;
        progress.add(n);
    }

    return true;
}
