#pragma once
#include <string>
#include <cstdint>

#include "RandomAccessWriter.h"

// Opens the file for every write and closes it again. The file is created if
// missing, but never truncated or pre-allocated.
class FileWriter : public RandomAccessWriter
{
public:
    explicit FileWriter(const std::string& path);

    bool writeAt(const char* data,
        std::size_t size,
        std::uint64_t offset,
        std::size_t& written,
        std::string& error) override;

    const std::string& path() const { return filePath; }

private:
    std::string filePath;
};
