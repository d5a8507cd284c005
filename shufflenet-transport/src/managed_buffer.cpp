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

#include "managed_buffer.h"

#include <glog/logging.h>

#include <algorithm>
#include <sstream>

namespace shufflenet {

ManagedBuffer ManagedBuffer::fromBytes(std::string bytes) {
    return wrap(std::make_shared<const std::string>(std::move(bytes)));
}

ManagedBuffer ManagedBuffer::wrap(std::shared_ptr<const std::string> bytes) {
    CHECK(bytes) << "ManagedBuffer::wrap: null region";
    auto core = std::make_shared<Core>();
    core->length = bytes->size();
    core->payload = MemorySegment{std::move(bytes)};
    return ManagedBuffer(std::move(core));
}

tl::expected<ManagedBuffer, ErrorCode> ManagedBuffer::fromFile(
    const std::string &path, uint64_t offset, uint64_t length) {
    auto file = PosixFile::open(path);
    if (!file) {
        return tl::make_unexpected(file.error());
    }
    auto file_size = (*file)->size();
    if (!file_size) {
        return tl::make_unexpected(file_size.error());
    }
    if (offset > *file_size || length > *file_size - offset) {
        LOG(ERROR) << "File segment [" << offset << ", " << offset + length
                   << ") exceeds size " << *file_size << " of " << path;
        return tl::make_unexpected(ErrorCode::FILE_SEGMENT_OUT_OF_RANGE);
    }

    auto core = std::make_shared<Core>();
    core->length = length;
    core->payload = FileSegment{std::move(*file), offset, length};
    return ManagedBuffer(std::move(core));
}

ManagedBuffer::Core &ManagedBuffer::liveCore(const char *op) const {
    CHECK(core_) << op << " on an empty ManagedBuffer";
    CHECK_GT(core_->ref_cnt.load(std::memory_order_acquire), 0)
        << op << " on a released ManagedBuffer";
    return *core_;
}

ManagedBuffer &ManagedBuffer::retain() {
    CHECK(core_) << "retain on an empty ManagedBuffer";
    int32_t cnt = core_->ref_cnt.load(std::memory_order_relaxed);
    do {
        CHECK_GT(cnt, 0) << "retain on a released ManagedBuffer";
    } while (!core_->ref_cnt.compare_exchange_weak(
        cnt, cnt + 1, std::memory_order_relaxed));
    return *this;
}

bool ManagedBuffer::release() {
    CHECK(core_) << "release on an empty ManagedBuffer";
    int32_t cnt = core_->ref_cnt.load(std::memory_order_relaxed);
    do {
        CHECK_GT(cnt, 0) << "release on a released ManagedBuffer";
    } while (!core_->ref_cnt.compare_exchange_weak(
        cnt, cnt - 1, std::memory_order_acq_rel));
    if (cnt != 1) {
        return false;
    }
    deallocate();
    return true;
}

void ManagedBuffer::deallocate() {
    // Destroying the segment closes the descriptor or drops the region.
    core_->payload = std::monostate{};
    if (core_->deallocate_hook) {
        auto hook = std::move(core_->deallocate_hook);
        core_->deallocate_hook = nullptr;
        hook();
    }
}

int32_t ManagedBuffer::refCnt() const {
    return core_ ? core_->ref_cnt.load(std::memory_order_acquire) : 0;
}

size_t ManagedBuffer::size() const { return core_ ? core_->length : 0; }

bool ManagedBuffer::isFileSegment() const {
    return core_ && std::holds_alternative<FileSegment>(core_->payload);
}

void ManagedBuffer::setDeallocateHook(std::function<void()> hook) {
    liveCore("setDeallocateHook").deallocate_hook = std::move(hook);
}

tl::expected<std::shared_ptr<const std::string>, ErrorCode>
ManagedBuffer::asBytes() const {
    auto &core = liveCore("asBytes");
    if (auto *memory = std::get_if<MemorySegment>(&core.payload)) {
        return memory->bytes;
    }
    auto &segment = std::get<FileSegment>(core.payload);
    auto bytes = std::make_shared<std::string>();
    if (segment.length > 0) {
        auto result = segment.file->read_at(*bytes, segment.length,
                                            static_cast<off_t>(segment.offset));
        if (!result) {
            return tl::make_unexpected(result.error());
        }
    }
    return std::shared_ptr<const std::string>(std::move(bytes));
}

tl::expected<BufferStream, ErrorCode> ManagedBuffer::asStream() const {
    auto &core = liveCore("asStream");
    if (auto *segment = std::get_if<FileSegment>(&core.payload)) {
        auto file_size = segment->file->size();
        if (!file_size) {
            return tl::make_unexpected(file_size.error());
        }
        if (segment->offset + segment->length > *file_size) {
            LOG(ERROR) << "File " << segment->file->filename()
                       << " shrank to " << *file_size
                       << " bytes, segment no longer readable";
            return tl::make_unexpected(ErrorCode::FILE_READ_FAIL);
        }
    }
    return BufferStream(*this);
}

std::string ManagedBuffer::toString() const {
    std::ostringstream oss;
    oss << "ManagedBuffer{";
    if (!core_) {
        oss << "empty}";
        return oss.str();
    }
    if (auto *segment = std::get_if<FileSegment>(&core_->payload)) {
        oss << "file=" << segment->file->filename()
            << ", offset=" << segment->offset << ", ";
    } else if (std::holds_alternative<MemorySegment>(core_->payload)) {
        oss << "memory, ";
    } else {
        oss << "released, ";
    }
    oss << "length=" << core_->length << ", refCnt=" << refCnt() << "}";
    return oss.str();
}

BufferStream::BufferStream(ManagedBuffer buffer)
    : buffer_(std::move(buffer)), length_(buffer_.size()) {}

tl::expected<std::string_view, ErrorCode> BufferStream::next(
    size_t max_bytes) {
    auto &core = buffer_.liveCore("BufferStream::next");
    size_t n = std::min(max_bytes, remaining());
    if (n == 0) {
        return std::string_view();
    }

    if (auto *memory =
            std::get_if<ManagedBuffer::MemorySegment>(&core.payload)) {
        std::string_view view(memory->bytes->data() + position_, n);
        position_ += n;
        return view;
    }

    auto &segment = std::get<ManagedBuffer::FileSegment>(core.payload);
    if (scratch_.size() < n) {
        scratch_.resize(n);
    }
    auto result = segment.file->read_at(
        scratch_.data(), n, static_cast<off_t>(segment.offset + position_));
    if (!result) {
        return tl::make_unexpected(result.error());
    }
    position_ += n;
    return std::string_view(scratch_.data(), n);
}

}  // namespace shufflenet
