#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>
#include <string>

// Byte and segment counters of the running attempt, shared by all workers.
class ProgressTracker {
public:
    explicit ProgressTracker(std::uint64_t totalBytes);

    void add(std::uint64_t bytes);
    void segmentDone();

    std::uint64_t downloaded() const;
    std::uint64_t segments() const;
    double progress() const;
    double elapsedSeconds() const;
    double speedBytesPerSec() const;

    // "<downloaded>/<total> bytes (<pct>%)"
    std::string describe() const;

    void reset(std::uint64_t totalBytes);

private:
    std::atomic<std::uint64_t> total;
    std::atomic<std::uint64_t> current{ 0 };
    std::atomic<std::uint64_t> segmentCount{ 0 };
    std::chrono::steady_clock::time_point start;
};
