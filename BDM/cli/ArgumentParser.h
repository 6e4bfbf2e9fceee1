#pragma once
#include <string>
#include <ostream>
#include "../core/utils.h"

struct CliOptions {
    std::string url;
    std::string outputPath;
    DownloadConfig config = defaultDownloadConfig();
    bool verbose = false;
};

class ArgumentParser {
public:
    explicit ArgumentParser(std::ostream& out);
    ArgumentParser();

    bool parse(int argc, char* argv[], CliOptions& out);

    void printUsage() const;

private:
    std::ostream& usageOut;
};

// Last path component of the URL without query or fragment, or "download".
std::string deriveOutputFromUrl(const std::string& url);
