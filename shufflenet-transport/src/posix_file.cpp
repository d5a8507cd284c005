#include <cerrno>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <glog/logging.h>

#include "posix_file.h"

namespace shufflenet {
PosixFile::PosixFile(const std::string &filename, int fd)
    : filename_(filename), fd_(fd) {}

PosixFile::~PosixFile() {
    if (fd_ >= 0) {
        if (close(fd_) != 0) {
            LOG(WARNING) << "Failed to close file: " << filename_;
        }
    }
    fd_ = -1;
}

tl::expected<std::unique_ptr<PosixFile>, ErrorCode> PosixFile::open(
    const std::string &filename) {
    int fd = ::open(filename.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        LOG(ERROR) << "Failed to open file: " << filename
                   << ", errno=" << err;
        return tl::make_unexpected(err == ENOENT ? ErrorCode::FILE_NOT_FOUND
                                                 : ErrorCode::FILE_OPEN_FAIL);
    }
    return std::make_unique<PosixFile>(filename, fd);
}

tl::expected<uint64_t, ErrorCode> PosixFile::size() const {
    if (fd_ < 0) {
        return tl::make_unexpected(ErrorCode::FILE_INVALID_HANDLE);
    }
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        return tl::make_unexpected(ErrorCode::FILE_INVALID_HANDLE);
    }
    return static_cast<uint64_t>(st.st_size);
}

tl::expected<size_t, ErrorCode> PosixFile::read_at(char *buffer,
                                                   size_t length,
                                                   off_t offset) const {
    if (fd_ < 0) {
        return tl::make_unexpected(ErrorCode::FILE_INVALID_HANDLE);
    }

    size_t read_bytes = 0;
    while (read_bytes < length) {
        ssize_t n = ::pread(fd_, buffer + read_bytes, length - read_bytes,
                            offset + static_cast<off_t>(read_bytes));
        if (n == -1) {
            if (errno == EINTR) continue;
            LOG(ERROR) << "pread failed on " << filename_
                       << ", errno=" << errno;
            return tl::make_unexpected(ErrorCode::FILE_READ_FAIL);
        }
        if (n == 0) break;  // EOF
        read_bytes += n;
    }

    if (read_bytes != length) {
        LOG(ERROR) << "Short read on " << filename_ << ": expected " << length
                   << " bytes at offset " << offset << ", got " << read_bytes;
        return tl::make_unexpected(ErrorCode::FILE_READ_FAIL);
    }
    return read_bytes;
}

tl::expected<size_t, ErrorCode> PosixFile::read_at(std::string &buffer,
                                                   size_t length,
                                                   off_t offset) const {
    buffer.resize(length);
    auto result = read_at(buffer.data(), length, offset);
    if (!result) {
        buffer.clear();
    }
    return result;
}

}  // namespace shufflenet
