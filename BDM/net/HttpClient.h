#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

struct HttpHeadResult {
    long status = 0;
    bool hasContentLength = false;
    std::uint64_t contentLength = 0;
    std::string etag;
    bool acceptRanges = false;
    std::string error;
};

struct HttpRangeResult {
    long status = 0;
    std::vector<char> body;
    std::string error;
};

// Both calls return false only on transport failure (no HTTP response);
// HTTP status handling is left to the caller.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual bool head(HttpHeadResult& out) = 0;
    virtual bool getRange(const std::string& rangeHeaderValue, HttpRangeResult& out) = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<HttpClient>(const std::string& url)>;
