#include "ProgressTracker.h"

#include <iomanip>
#include <sstream>

ProgressTracker::ProgressTracker(std::uint64_t totalBytes)
    : total(totalBytes),
    start(std::chrono::steady_clock::now()) {
}

void ProgressTracker::add(std::uint64_t bytes) {
    current.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressTracker::segmentDone() {
    segmentCount.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::downloaded() const {
    return current.load(std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::segments() const {
    return segmentCount.load(std::memory_order_relaxed);
}

double ProgressTracker::progress() const {
    const std::uint64_t t = total.load(std::memory_order_relaxed);
    return t == 0 ? 0.0 : (double)downloaded() / (double)t;
}

double ProgressTracker::elapsedSeconds() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count();
}

double ProgressTracker::speedBytesPerSec() const {
    const double secs = elapsedSeconds();
    return secs > 0 ? downloaded() / secs : 0.0;
}

std::string ProgressTracker::describe() const {
    std::ostringstream os;
    os << downloaded() << "/" << total.load(std::memory_order_relaxed) << " bytes ("
        << std::fixed << std::setprecision(1) << progress() * 100.0 << "%)";
    return os.str();
}

void ProgressTracker::reset(std::uint64_t totalBytes) {
    total.store(totalBytes, std::memory_order_relaxed);
    current.store(0, std::memory_order_relaxed);
    segmentCount.store(0, std::memory_order_relaxed);
    start = std::chrono::steady_clock::now();
}
