#include "Downloader.h"

#include <utility>

#include "DownloadOrchestrator.h"
#include "../io/FileWriter.h"
#include "../net/CurlHttpClient.h"

Downloader::Downloader(DownloadConfig config, Logger& log)
    : Downloader(config, log, makeCurlClientFactory(config.connectTimeoutSeconds, config.requestTimeoutSeconds)) {
}

Downloader::Downloader(DownloadConfig config, Logger& log, HttpClientFactory clientFactory)
    : cfg(std::move(config)), logger(log), makeClient(std::move(clientFactory)) {
}

DownloadResult Downloader::download(const std::string& url, const std::string& destinationPath) {
    FileWriter fileWriter(destinationPath);
    DownloadOrchestrator orchestrator(cfg, url, fileWriter, makeClient, logger);

    DownloadResult result = orchestrator.run();
    if (!result.success) {
        result.error.wrap("failed to download file from " + url + " to " + destinationPath)
            .withUrl(url)
            .withPath(destinationPath);
    }

    return result;
}
