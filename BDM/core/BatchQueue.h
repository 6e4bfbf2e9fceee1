#pragma once
#include <vector>
#include <mutex>
#include <optional>
#include <cstddef>

#include "BatchPlanner.h"

enum class BatchState {
    Pending,
    InProgress,
    Done,
    Failed
};

// Hands out batches of one attempt to the workers, each batch exactly once.
class BatchQueue {
public:
    explicit BatchQueue(std::vector<Batch>& batches);

    // Index into the batch vector; the caller owns that batch until finish().
    std::optional<std::size_t> getNext();
    Batch& at(std::size_t batchIndex);
    void finish(std::size_t batchIndex, bool success);

    bool allFinished() const;
    std::size_t failedCount() const;
    std::size_t size() const { return states.size(); }

private:
    std::vector<Batch>& batchesRef;
    std::vector<BatchState> states;
    std::size_t nextPending{ 0 };
    mutable std::mutex mtx;
};
