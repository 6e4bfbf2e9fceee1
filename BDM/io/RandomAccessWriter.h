#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

// Persists bytes at an absolute position of the destination.
class RandomAccessWriter {
public:
    virtual ~RandomAccessWriter() = default;

    // On success `written` holds the number of bytes stored, which may be
    // less than `size`. On failure `error` describes the I/O error.
    virtual bool writeAt(const char* data,
        std::size_t size,
        std::uint64_t offset,
        std::size_t& written,
        std::string& error) = 0;
};
