#pragma once

#include <sys/types.h>

#include <memory>
#include <string>

#include "types.h"

namespace shufflenet {

/**
 * @class PosixFile
 * @brief RAII wrapper around a read-only file descriptor
 *
 * Reads are positional (pread), so one PosixFile can serve concurrent
 * readers of disjoint or overlapping ranges without sharing a file offset.
 * The descriptor is closed by the destructor.
 */
class PosixFile {
   public:
    PosixFile(const std::string &filename, int fd);
    ~PosixFile();

    PosixFile(const PosixFile &) = delete;
    PosixFile &operator=(const PosixFile &) = delete;

    /**
     * @brief Opens a file for reading
     * @return the opened file, or FILE_NOT_FOUND / FILE_OPEN_FAIL
     */
    static tl::expected<std::unique_ptr<PosixFile>, ErrorCode> open(
        const std::string &filename);

    /**
     * @brief Current size of the file in bytes
     * @return tl::expected<uint64_t, ErrorCode> containing the size, or
     * FILE_INVALID_HANDLE if fstat fails
     */
    tl::expected<uint64_t, ErrorCode> size() const;

    /**
     * @brief Reads exactly length bytes starting at offset
     * @param buffer Destination, must hold at least length bytes
     * @param length Number of bytes to read
     * @param offset File offset to read from
     * @return tl::expected<size_t, ErrorCode> containing number of bytes read
     * on success, or FILE_READ_FAIL on I/O error or premature end of file
     */
    tl::expected<size_t, ErrorCode> read_at(char *buffer, size_t length,
                                            off_t offset) const;

    /**
     * @brief Reads exactly length bytes starting at offset into a string
     * @note buffer is resized to length; cleared on failure
     */
    tl::expected<size_t, ErrorCode> read_at(std::string &buffer,
                                            size_t length,
                                            off_t offset) const;

    const std::string &filename() const { return filename_; }

    int fd() const { return fd_; }

   private:
    std::string filename_;
    int fd_;
};

}  // namespace shufflenet
