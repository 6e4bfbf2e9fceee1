#include "BatchQueue.h"

#include <algorithm>

BatchQueue::BatchQueue(std::vector<Batch>& batches)
    : batchesRef(batches), states(batches.size(), BatchState::Pending) {
}

std::optional<std::size_t> BatchQueue::getNext() {
    std::lock_guard<std::mutex> lock(mtx);
    if (nextPending >= states.size())
        return std::nullopt;

    std::size_t index = nextPending++;
    states[index] = BatchState::InProgress;
    return index;
}

Batch& BatchQueue::at(std::size_t batchIndex) {
    return batchesRef[batchIndex];
}

void BatchQueue::finish(std::size_t batchIndex, bool success) {
    std::lock_guard<std::mutex> lock(mtx);
    if (batchIndex < states.size())
        states[batchIndex] = success ? BatchState::Done : BatchState::Failed;
}

bool BatchQueue::allFinished() const {
    std::lock_guard<std::mutex> lock(mtx);
    return std::all_of(states.begin(), states.end(), [](BatchState s) {
        return s == BatchState::Done || s == BatchState::Failed;
        });
}

std::size_t BatchQueue::failedCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return static_cast<std::size_t>(std::count(states.begin(), states.end(), BatchState::Failed));
}
