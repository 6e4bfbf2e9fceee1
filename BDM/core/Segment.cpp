#include "Segment.h"

#include <algorithm>
#include <sstream>

Segment::Segment(RandomAccessWriter& w, std::uint64_t startOffset, std::uint64_t length)
    : writer(&w), start(startOffset), size(length) {
}

std::string Segment::rangeHeaderValue() const {
    std::ostringstream range;
    range << "bytes=" << start << "-" << (start + size - 1);
    return range.str();
}

bool Segment::write(const char* data, std::size_t len, std::size_t& written, DownloadError& err) {
    written = 0;
    if (complete())
        return true;

    const std::size_t remaining = static_cast<std::size_t>(
        std::min<std::uint64_t>(size - current, len));
    if (remaining == 0)
        return true;

    const std::uint64_t offset = writeOffset();
    std::string ioError;

    if (!writer->writeAt(data, remaining, offset, written, ioError)) {
        std::ostringstream os;
        os << "failed to write to file at offset " << offset << "; size: " << remaining;
        err = DownloadError(ErrorKind::WriteFailed, ioError);
        err.wrap(os.str()).withRange(offset, remaining);
        written = 0;
        return false;
    }

    current += written;
    return true;
}
