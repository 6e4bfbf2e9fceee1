#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

#include "DownloadError.h"
#include "../io/RandomAccessWriter.h"

// One contiguous byte range of the remote resource, written at the same
// offset in the destination.
class Segment {
public:
    Segment(RandomAccessWriter& writer, std::uint64_t startOffset, std::uint64_t length);

    std::uint64_t startOffset() const { return start; }
    std::uint64_t length() const { return size; }
    std::uint64_t writtenSoFar() const { return current; }
    bool complete() const { return current >= size; }

    // Absolute destination offset of the next byte to persist.
    std::uint64_t writeOffset() const { return start + current; }

    // Inclusive range for the Range request header: "bytes=<first>-<last>".
    std::string rangeHeaderValue() const;

    // Stores up to length() - writtenSoFar() bytes of `data` at
    // startOffset() + writtenSoFar(). `written` is 0 once the segment is
    // complete. A short write is not retried here.
    bool write(const char* data, std::size_t len, std::size_t& written, DownloadError& err);

private:
    RandomAccessWriter* writer;
    std::uint64_t start;
    std::uint64_t size;
    std::uint64_t current{ 0 };
};
