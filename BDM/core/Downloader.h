#pragma once
#include <string>

#include "utils.h"
#include "../net/HttpClient.h"
#include "../monitor/Logger.h"

// Downloads a resource into a local file with batched range requests.
class Downloader {
public:
    // Uses libcurl with the timeouts from `config`.
    Downloader(DownloadConfig config, Logger& logger);
    Downloader(DownloadConfig config, Logger& logger, HttpClientFactory clientFactory);

    // Writes the resource at `url` into `destinationPath`. On failure the
    // error chain starts with "failed to download file from <url> to <path>".
    DownloadResult download(const std::string& url, const std::string& destinationPath);

    const DownloadConfig& config() const { return cfg; }

private:
    DownloadConfig cfg;
    Logger& logger;
    HttpClientFactory makeClient;
};
