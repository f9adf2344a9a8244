#include "ChunkFile.h"

#include <cerrno>
#include <cstring>
#include <filesystem>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#include <fcntl.h>
#endif

namespace fs = std::filesystem;

namespace {
std::string lastSystemError() {
    return std::strerror(errno);
}
}

ChunkFile::ChunkFile(const std::string& tmpPath, const std::string& partPath)
    : partialPath(tmpPath), completePath(partPath) {
}

ChunkFile::~ChunkFile() {
    close();
}

bool ChunkFile::isComplete() const {
    std::error_code ec;
    return fs::exists(completePath, ec);
}

Error ChunkFile::open() {
    close();

#ifdef _WIN32
    int flags = _O_BINARY | _O_WRONLY | _O_CREAT | _O_APPEND;
    int mode = _S_IREAD | _S_IWRITE;
    fileHandle = _open(partialPath.c_str(), flags, mode);
#else
    int flags = O_WRONLY | O_CREAT | O_APPEND;
    int mode = 0644;
    fileHandle = ::open(partialPath.c_str(), flags, mode);
#endif

    if (fileHandle < 0)
        return { ErrorCode::Io, "failed to open " + partialPath + ": " + lastSystemError() };

    std::error_code ec;
    auto sz = fs::file_size(partialPath, ec);
    if (ec) {
        close();
        return { ErrorCode::Io, "failed to stat " + partialPath + ": " + ec.message() };
    }
    currentSize = static_cast<std::int64_t>(sz);

    return {};
}

Error ChunkFile::reset() {
    close();

    std::error_code ec;
    fs::remove(partialPath, ec);
    if (ec)
        return { ErrorCode::Io, "failed to discard " + partialPath + ": " + ec.message() };

    return open();
}

bool ChunkFile::write(const char* data, std::size_t size) {
    if (fileHandle < 0)
        return false;

    while (size > 0) {
#ifdef _WIN32
        int n = _write(fileHandle, data, static_cast<unsigned int>(size));
#else
        ssize_t n = ::write(fileHandle, data, size);
#endif
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
        currentSize += n;
    }
    return true;
}

Error ChunkFile::finalize() {
    if (fileHandle >= 0) {
#ifdef _WIN32
        _commit(fileHandle);
#else
        if (fsync(fileHandle) != 0) {
            std::string why = lastSystemError();
            close();
            return { ErrorCode::Io, "failed to sync " + partialPath + ": " + why };
        }
#endif
    }
    close();

    std::error_code ec;
    fs::rename(partialPath, completePath, ec);
    if (ec)
        return { ErrorCode::Io, "failed to rename " + partialPath + " to " + completePath + ": " + ec.message() };

    return {};
}

void ChunkFile::close() {
    if (fileHandle >= 0) {
#ifdef _WIN32
        _close(fileHandle);
#else
        ::close(fileHandle);
#endif
        fileHandle = -1;
    }
}
