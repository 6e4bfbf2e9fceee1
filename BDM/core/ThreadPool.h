#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>

class ThreadPool {
public:
    using WorkerFn = std::function<void()>;

    explicit ThreadPool(std::atomic<bool>& stopFlag);
    ~ThreadPool();

    void start(std::size_t n, WorkerFn worker);
    void join();
    void shutdown();

private:
    std::vector<std::thread> threads;
    std::atomic<bool>& shouldStop;
    std::mutex mtx;
};
