#pragma once
#include <queue>
#include <memory>
#include <mutex>
#include <string>

#include "../net/HttpClient.h"

// Keeps idle HTTP clients for reuse by the batch workers.
class ConnectionPool {
public:
    ConnectionPool(const std::string& url, std::size_t maxSize, HttpClientFactory factory);

    std::unique_ptr<HttpClient> acquire();
    void release(std::unique_ptr<HttpClient> client);

private:
    std::string url;
    std::size_t maxPoolSize;
    HttpClientFactory makeClient;
    std::queue<std::unique_ptr<HttpClient>> pool;
    std::mutex mtx;
};
