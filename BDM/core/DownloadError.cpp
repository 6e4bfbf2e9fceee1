#include "DownloadError.h"

#include <utility>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::NotFound: return "not-found";
    case ErrorKind::Forbidden: return "forbidden";
    case ErrorKind::Unauthorized: return "unauthorized";
    case ErrorKind::RangeNotSatisfiable: return "range-not-satisfiable";
    case ErrorKind::HttpStatus: return "http-status";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::InvalidSize: return "invalid-size";
    case ErrorKind::RangeUnsupported: return "range-unsupported";
    case ErrorKind::UnexpectedStatus: return "unexpected-status";
    case ErrorKind::WriteFailed: return "write-failed";
    case ErrorKind::Integrity: return "integrity";
    case ErrorKind::InvalidConfig: return "invalid-config";
    }
    return "unknown";
}

ErrorKind classifyDiscoveryStatus(long status) {
    switch (status) {
    case 404: return ErrorKind::NotFound;
    case 403: return ErrorKind::Forbidden;
    case 401: return ErrorKind::Unauthorized;
    case 416: return ErrorKind::RangeNotSatisfiable;
    default: return ErrorKind::HttpStatus;
    }
}

DownloadError::DownloadError(ErrorKind kind, std::string cause)
    : errKind(kind) {
    chain.push_back(std::move(cause));
}

DownloadError& DownloadError::wrap(std::string context) {
    chain.push_back(std::move(context));
    return *this;
}

DownloadError& DownloadError::withStatus(long s) {
    status = s;
    return *this;
}

DownloadError& DownloadError::withRange(std::uint64_t offset, std::uint64_t size) {
    // keep the innermost range, it is the one that actually failed
    if (!errOffset) {
        errOffset = offset;
        errSize = size;
    }
    return *this;
}

DownloadError& DownloadError::withUrl(std::string u) {
    errUrl = std::move(u);
    return *this;
}

DownloadError& DownloadError::withPath(std::string p) {
    errPath = std::move(p);
    return *this;
}

DownloadError& DownloadError::withAttempts(unsigned attempts) {
    attemptCount = attempts;
    return *this;
}

const std::string& DownloadError::rootCause() const {
    static const std::string empty;
    return chain.empty() ? empty : chain.front();
}

std::string DownloadError::message() const {
    std::string out;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!out.empty())
            out += "; error: ";
        out += *it;
    }
    return out;
}
