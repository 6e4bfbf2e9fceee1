#include "ArgumentParser.h"
#include <iostream>
#include <stdexcept>
#include <limits>

namespace {
template <typename T>
bool parseNumber(const std::string& text, T& out) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size())
            return false;
        if (value < static_cast<long long>(std::numeric_limits<T>::min()) ||
            value > static_cast<long long>(std::numeric_limits<T>::max()))
            return false;
        out = static_cast<T>(value);
        return true;
    }
    catch (const std::logic_error&) {
        return false;
    }
}
}

std::string deriveOutputFromUrl(const std::string& url) {
    std::string name = url;

    auto special = name.find_first_of("?#");
    if (special != std::string::npos)
        name = name.substr(0, special);

    // Get file name from url
    auto slash = name.find_last_of('/');
    if (slash != std::string::npos)
        name = name.substr(slash + 1);

    if (name.empty())
        name = "download";

    return name;
}

ArgumentParser::ArgumentParser(std::ostream& out)
    : usageOut(out) {
}

ArgumentParser::ArgumentParser()
    : ArgumentParser(std::cout) {
}

bool ArgumentParser::parse(int argc, char* argv[], CliOptions& out) {
    if (argc < 2) {
        printUsage();
        return false;
    }

    out = CliOptions{};
    out.url = argv[1];

    if (out.url.empty() || out.url[0] == '-') {
        printUsage();
        return false;
    }

    bool ok = true;
    for (int i = 2; i < argc && ok; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "-o" && hasValue) {
            out.outputPath = argv[++i];
        }
        else if (arg == "-c" && hasValue) {
            ok = parseNumber(argv[++i], out.config.maxConcurrentDownloads);
        }
        else if (arg == "-s" && hasValue) {
            ok = parseNumber(argv[++i], out.config.fixedSegmentSizeBytes);
        }
        else if (arg == "-r" && hasValue) {
            ok = parseNumber(argv[++i], out.config.maxRetries);
        }
        else if (arg == "-t" && hasValue) {
            long long threads = 0;
            ok = parseNumber(argv[++i], threads) && threads >= 0;
            if (ok)
                out.config.maxWorkerThreads = static_cast<std::size_t>(threads);
        }
        else if (arg == "-p" && hasValue) {
            std::string policy = argv[++i];
            if (policy == "count")
                out.config.segmentPolicy = SegmentPolicy::TieredCount;
            else if (policy == "size")
                out.config.segmentPolicy = SegmentPolicy::TieredSize;
            else
                ok = false;
        }
        else if (arg == "--timeout" && hasValue) {
            ok = parseNumber(argv[++i], out.config.requestTimeoutSeconds) && out.config.requestTimeoutSeconds >= 0;
        }
        else if (arg == "--no-verify") {
            out.config.verifyTotalBytes = false;
        }
        else if (arg == "-v") {
            out.verbose = true;
        }
        else {
            ok = false;
        }
    }

    if (!ok) {
        printUsage();
        return false;
    }

    if (out.outputPath.empty())
        out.outputPath = deriveOutputFromUrl(out.url);

    return true;
}

void ArgumentParser::printUsage() const {
    usageOut <<
        "Usage:\n"
        "  bdm <url> [-o <output>] [options]\n\n"
        "Options:\n"
        "  -o <file>        Output file path (default: name from url)\n"
        "  -c <n>           Max concurrent batches, <= 0 for one per segment (default: 32)\n"
        "  -s <bytes>       Fixed segment size (default: derived from file size)\n"
        "  -p count|size    Segment policy when no fixed size is given (default: count)\n"
        "  -r <n>           Max attempts (default: 3)\n"
        "  -t <threads>     Max worker threads, 0 = auto (default: 128)\n"
        "  --timeout <sec>  Per-request timeout, 0 = none (default: 0)\n"
        "  --no-verify      Do not compare bytes written with the content length\n"
        "  -v               Debug logging\n";
}
