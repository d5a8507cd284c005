// Copyright 2025 KVCache.AI
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef MANAGED_BUFFER_H_
#define MANAGED_BUFFER_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "posix_file.h"
#include "types.h"

namespace shufflenet {

class BufferStream;

/**
 * ManagedBuffer is a reference-counted view over either an in-memory byte
 * region or a byte range of a file.
 *
 * The reference count starts at 1 when the buffer is created. Every holder
 * that outlives the creator's scope calls retain() and later release(); the
 * underlying memory or file descriptor is freed exactly once, on the 1 -> 0
 * transition. Retaining, releasing or reading a buffer whose count already
 * reached 0 is a lifetime bug in the caller and aborts the process.
 *
 * A ManagedBuffer value is a handle: copying it does not touch the count,
 * all copies observe the same counted resource.
 */
class ManagedBuffer {
   public:
    ManagedBuffer() = default;

    // Takes ownership of bytes.
    static ManagedBuffer fromBytes(std::string bytes);

    // Views bytes that may also be shared with other buffers. The region is
    // not copied; this buffer drops its share when the count reaches 0.
    static ManagedBuffer wrap(std::shared_ptr<const std::string> bytes);

    // Opens path and checks that [offset, offset + length) lies inside the
    // file. The descriptor stays open until the count reaches 0.
    static tl::expected<ManagedBuffer, ErrorCode> fromFile(
        const std::string &path, uint64_t offset, uint64_t length);

    ManagedBuffer &retain();

    // Returns true if this call freed the underlying resource.
    bool release();

    [[nodiscard]] int32_t refCnt() const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool isFileSegment() const;

    /**
     * @brief Returns the whole content as one contiguous region
     * @note The in-memory variant returns its own region without copying.
     * The file variant performs a single positional read of size() bytes.
     */
    tl::expected<std::shared_ptr<const std::string>, ErrorCode> asBytes()
        const;

    /**
     * @brief Opens a piecewise reader over the content, for transmitting
     * without materializing the whole buffer
     * @note The buffer must stay retained while the stream is in use. For
     * the file variant the file length is re-validated here.
     */
    tl::expected<BufferStream, ErrorCode> asStream() const;

    // Runs exactly once, right after the resource is freed. Must be set
    // before the buffer is shared with other threads.
    void setDeallocateHook(std::function<void()> hook);

    std::string toString() const;

    explicit operator bool() const { return core_ != nullptr; }

   private:
    struct MemorySegment {
        std::shared_ptr<const std::string> bytes;
    };

    struct FileSegment {
        std::unique_ptr<PosixFile> file;
        uint64_t offset;
        uint64_t length;
    };

    struct Core {
        std::atomic<int32_t> ref_cnt{1};
        size_t length{0};
        std::variant<std::monostate, MemorySegment, FileSegment> payload;
        std::function<void()> deallocate_hook;
    };

    explicit ManagedBuffer(std::shared_ptr<Core> core)
        : core_(std::move(core)) {}

    // Returns the core, aborting if the handle is empty or released.
    Core &liveCore(const char *op) const;

    void deallocate();

    std::shared_ptr<Core> core_;

    friend class BufferStream;
};

/**
 * BufferStream yields the content of a ManagedBuffer in pieces of at most
 * max_bytes. In-memory content is returned as views into the buffer's own
 * region; file content is read piece by piece into one reusable scratch
 * buffer, so a large file segment is never held in memory at once.
 *
 * A view returned by next() stays valid until the following call to next().
 */
class BufferStream {
   public:
    tl::expected<std::string_view, ErrorCode> next(size_t max_bytes);

    size_t position() const { return position_; }
    size_t remaining() const { return length_ - position_; }
    bool done() const { return position_ >= length_; }

   private:
    friend class ManagedBuffer;

    explicit BufferStream(ManagedBuffer buffer);

    ManagedBuffer buffer_;
    size_t length_;
    size_t position_ = 0;
    std::string scratch_;
};

}  // namespace shufflenet

#endif  // MANAGED_BUFFER_H_
