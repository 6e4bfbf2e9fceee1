#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

enum class ErrorKind {
    None,

    // size discovery
    NotFound,
    Forbidden,
    Unauthorized,
    RangeNotSatisfiable,
    HttpStatus,
    Transport,
    InvalidSize,

    // segment protocol
    RangeUnsupported,
    UnexpectedStatus,

    WriteFailed,
    Integrity,
    InvalidConfig
};

const char* errorKindName(ErrorKind kind);

// Error kind for a failed metadata probe with the given HTTP status.
ErrorKind classifyDiscoveryStatus(long status);

// A failure plus the context added by every layer it passed through.
// frames[0] is the root cause, the last frame is the outermost context.
class DownloadError {
public:
    DownloadError() = default;
    DownloadError(ErrorKind kind, std::string cause);

    ErrorKind kind() const { return errKind; }
    bool failed() const { return errKind != ErrorKind::None; }

    DownloadError& wrap(std::string context);

    DownloadError& withStatus(long status);
    DownloadError& withRange(std::uint64_t offset, std::uint64_t size);
    DownloadError& withUrl(std::string url);
    DownloadError& withPath(std::string path);
    DownloadError& withAttempts(unsigned attempts);

    const std::optional<long>& statusCode() const { return status; }
    const std::optional<std::uint64_t>& offset() const { return errOffset; }
    const std::optional<std::uint64_t>& size() const { return errSize; }
    const std::string& url() const { return errUrl; }
    const std::string& path() const { return errPath; }
    unsigned attempts() const { return attemptCount; }

    const std::vector<std::string>& frames() const { return chain; }
    const std::string& rootCause() const;

    // "outer; error: ...; error: root"
    std::string message() const;

private:
    ErrorKind errKind{ ErrorKind::None };
    std::vector<std::string> chain;

    std::optional<long> status;
    std::optional<std::uint64_t> errOffset;
    std::optional<std::uint64_t> errSize;
    std::string errUrl;
    std::string errPath;
    unsigned attemptCount{ 0 };
};
