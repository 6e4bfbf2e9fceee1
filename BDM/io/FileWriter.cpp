#include "FileWriter.h"

#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#include <fcntl.h>
#endif

namespace {
std::string lastErrno(const char* what) {
    const int code = errno;
    return std::string(what) + ": " + std::strerror(code);
}
}

FileWriter::FileWriter(const std::string& path)
    : filePath(path) {
}

bool FileWriter::writeAt(const char* data,
    std::size_t size,
    std::uint64_t offset,
    std::size_t& written,
    std::string& error) {
    written = 0;

#ifdef _WIN32
    int flags = _O_BINARY | _O_WRONLY | _O_CREAT;
    int mode = _S_IREAD | _S_IWRITE;
    int fd = _open(filePath.c_str(), flags, mode);
#else
    int flags = O_WRONLY | O_CREAT;
    int mode = 0644;
    int fd = ::open(filePath.c_str(), flags, mode);
#endif

    if (fd < 0) {
        error = lastErrno("open failed");
        return false;
    }

    bool ok = true;

#ifdef _WIN32
    if (_lseeki64(fd, static_cast<__int64>(offset), SEEK_SET) < 0) {
        error = lastErrno("seek failed");
        ok = false;
    }
    else {
        int n = _write(fd, data, static_cast<unsigned int>(size));
        if (n < 0) {
            error = lastErrno("write failed");
            ok = false;
        }
        else {
            written = static_cast<std::size_t>(n);
        }
    }

    if (_close(fd) != 0 && ok) {
        error = lastErrno("close failed");
        ok = false;
    }
#else
    // retry interrupted writes, a short count is returned to the caller as is
    ssize_t n = -1;
    do {
        n = ::pwrite(fd, data, size, static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        error = lastErrno("write failed");
        ok = false;
    }
    else {
        written = static_cast<std::size_t>(n);
    }

    if (::close(fd) != 0 && ok) {
        error = lastErrno("close failed");
        ok = false;
    }
#endif

    return ok;
}
