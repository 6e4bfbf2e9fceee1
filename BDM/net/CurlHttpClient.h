#pragma once
#include <string>

#include "HttpClient.h"

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient(const std::string& url, long connectTimeoutSeconds, long requestTimeoutSeconds);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    bool head(HttpHeadResult& out) override;
    bool getRange(const std::string& rangeHeaderValue, HttpRangeResult& out) override;

private:
    void applyCommonOptions();

private:
    void* curl;
    std::string url;
    long connectTimeout;
    long requestTimeout;
};

// Feeds one raw response header line (status line included) into `result`.
// Only the headers of the last response in a redirect chain survive.
void parseResponseHeaderLine(const std::string& header, HttpHeadResult& result);

std::string rangeRequestHeader(const std::string& rangeHeaderValue);

HttpClientFactory makeCurlClientFactory(long connectTimeoutSeconds, long requestTimeoutSeconds);

// curl_global_init / curl_global_cleanup for the lifetime of the object.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return initialized; }

private:
    bool initialized{ false };
};
