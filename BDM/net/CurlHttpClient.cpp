#include "CurlHttpClient.h"

#include <curl/curl.h>
#include <string>
#include <cctype>

namespace {
size_t bodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<char>*>(userdata);
    std::size_t total = size * nmemb;
    body->insert(body->end(), ptr, ptr + total);
    return total;
}

bool startsWithNoCase(const std::string& s, const char* prefix) {
    std::size_t n = std::char_traits<char>::length(prefix);
    if (s.size() < n)
        return false;
    for (std::size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    parseResponseHeaderLine(std::string(buffer, total), *static_cast<HttpHeadResult*>(userdata));
    return total;
}
}

void parseResponseHeaderLine(const std::string& header, HttpHeadResult& result) {
    // a new status line starts a new response (redirect hop)
    if (startsWithNoCase(header, "HTTP/")) {
        result.etag.clear();
        result.acceptRanges = false;
    }
    else if (startsWithNoCase(header, "ETag:")) {
        result.etag = trim(header.substr(5));
    }
    else if (startsWithNoCase(header, "Accept-Ranges:")) {
        if (header.find("bytes") != std::string::npos)
            result.acceptRanges = true;
    }
}

std::string rangeRequestHeader(const std::string& rangeHeaderValue) {
    return "Range: " + rangeHeaderValue;
}

CurlHttpClient::CurlHttpClient(const std::string& u, long connectTimeoutSeconds, long requestTimeoutSeconds)
    : url(u), connectTimeout(connectTimeoutSeconds), requestTimeout(requestTimeoutSeconds) {
    curl = curl_easy_init();
}

CurlHttpClient::~CurlHttpClient() {
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

void CurlHttpClient::applyCommonOptions() {
    CURL* c = static_cast<CURL*>(curl);

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    if (connectTimeout > 0)
        curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, connectTimeout);
    if (requestTimeout > 0)
        curl_easy_setopt(c, CURLOPT_TIMEOUT, requestTimeout);
}

bool CurlHttpClient::head(HttpHeadResult& out) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        out.error = "curl_easy_init failed";
        return false;
    }

    curl_easy_reset(c);
    applyCommonOptions();

    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &out);

    CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK) {
        out.error = curl_easy_strerror(res);
        return false;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);

    curl_off_t length = -1;
    if (curl_easy_getinfo(c, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
        out.hasContentLength = true;
        out.contentLength = static_cast<std::uint64_t>(length);
    }

    return true;
}

bool CurlHttpClient::getRange(const std::string& rangeHeaderValue, HttpRangeResult& out) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        out.error = "curl_easy_init failed";
        return false;
    }

    curl_easy_reset(c);
    applyCommonOptions();

    const std::string rangeHeader = rangeRequestHeader(rangeHeaderValue);
    curl_slist* headers = curl_slist_append(nullptr, rangeHeader.c_str());

    out.body.clear();
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, bodyCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, static_cast<void*>(&out.body));

    CURLcode res = curl_easy_perform(c);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        out.error = curl_easy_strerror(res);
        return false;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);
    return true;
}

HttpClientFactory makeCurlClientFactory(long connectTimeoutSeconds, long requestTimeoutSeconds) {
    return [connectTimeoutSeconds, requestTimeoutSeconds](const std::string& url) -> std::unique_ptr<HttpClient> {
        return std::make_unique<CurlHttpClient>(url, connectTimeoutSeconds, requestTimeoutSeconds);
    };
}

CurlGlobal::CurlGlobal() {
    initialized = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

CurlGlobal::~CurlGlobal() {
    if (initialized)
        curl_global_cleanup();
}
