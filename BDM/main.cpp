#include <iostream>
#include "cli/ArgumentParser.h"
#include "core/Downloader.h"
#include "monitor/Logger.h"
#include "net/CurlHttpClient.h"

int main(int argc, char* argv[]) {
    CliOptions options;
    ArgumentParser parser;

    if (!parser.parse(argc, argv, options))
        return 1;

    CurlGlobal curl;
    if (!curl.ok()) {
        std::cerr << "failed to initialize libcurl" << std::endl;
        return 1;
    }

    Logger logger(std::cout);
    if (options.verbose)
        logger.setMinLevel(LogLevel::Debug);
    logger.start();

    Downloader downloader(options.config, logger);
    DownloadResult result = downloader.download(options.url, options.outputPath);

    if (result.success) {
        logger.log("Downloaded " + std::to_string(result.bytesWritten) + " bytes");
        logger.log("Saved to " + options.outputPath);
    }
    else {
        logger.log(LogLevel::Error, std::string("Error (") + errorKindName(result.error.kind()) + "): " +
            result.error.message());
    }

    logger.stop();
    return result.success ? 0 : 1;
}
