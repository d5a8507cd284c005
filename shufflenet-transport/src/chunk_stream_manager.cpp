#include "chunk_stream_manager.h"

#include <glog/logging.h>

#include <algorithm>
#include <random>

namespace shufflenet {

FileChunkResolver::FileChunkResolver(std::string path,
                                     std::vector<uint64_t> chunk_offsets)
    : path_(std::move(path)), chunk_offsets_(std::move(chunk_offsets)) {
    CHECK(std::is_sorted(chunk_offsets_.begin(), chunk_offsets_.end()))
        << "chunk offsets of " << path_ << " must be sorted";
}

tl::expected<ManagedBuffer, ErrorCode> FileChunkResolver::operator()(
    int32_t chunk_index, int32_t offset, int32_t len) const {
    if (chunk_index < 0 || chunk_index >= numChunks()) {
        return tl::make_unexpected(ErrorCode::INVALID_CHUNK_INDEX);
    }
    if (offset < 0 || len < 0) {
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    uint64_t chunk_start = chunk_offsets_[chunk_index];
    uint64_t chunk_length = chunk_offsets_[chunk_index + 1] - chunk_start;
    uint64_t skip = std::min<uint64_t>(offset, chunk_length);
    uint64_t length =
        std::min<uint64_t>(static_cast<uint64_t>(len), chunk_length - skip);
    return ManagedBuffer::fromFile(path_, chunk_start + skip, length);
}

ChunkStreamManager::ChunkStreamManager() {
    std::random_device rd;
    std::uniform_int_distribution<int32_t> dist(0, 1 << 30);
    next_stream_id_ = static_cast<StreamId>(dist(rd)) * 1000;
}

ErrorCode ChunkStreamManager::registerStream(StreamId stream_id,
                                             int32_t num_chunks,
                                             ChunkResolver resolver) {
    if (num_chunks < 0 || !resolver) {
        LOG(ERROR) << "Invalid stream registration, stream_id=" << stream_id
                   << ", num_chunks=" << num_chunks;
        return ErrorCode::INVALID_PARAMS;
    }
    SharedMutexLocker lock(&mutex_);
    auto [it, inserted] = streams_.try_emplace(
        stream_id, StreamState{num_chunks, std::move(resolver)});
    if (!inserted) {
        LOG(WARNING) << "Stream " << stream_id << " is already registered";
        return ErrorCode::STREAM_ALREADY_EXISTS;
    }
    VLOG(1) << "Registered stream " << stream_id << " with " << num_chunks
            << " chunks";
    return ErrorCode::OK;
}

tl::expected<StreamId, ErrorCode> ChunkStreamManager::registerStream(
    int32_t num_chunks, ChunkResolver resolver) {
    StreamId stream_id = next_stream_id_.fetch_add(1);
    auto err = registerStream(stream_id, num_chunks, std::move(resolver));
    if (err != ErrorCode::OK) {
        return tl::make_unexpected(err);
    }
    return stream_id;
}

ErrorCode ChunkStreamManager::unregisterStream(StreamId stream_id) {
    SharedMutexLocker lock(&mutex_);
    if (streams_.erase(stream_id) == 0) {
        return ErrorCode::STREAM_NOT_FOUND;
    }
    return ErrorCode::OK;
}

tl::expected<ManagedBuffer, ErrorCode> ChunkStreamManager::getChunk(
    StreamId stream_id, int32_t chunk_index, int32_t offset, int32_t len) {
    ChunkResolver resolver;
    {
        SharedMutexLocker lock(&mutex_, shared_lock);
        auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            LOG(WARNING) << "Requested chunk " << chunk_index
                         << " of unknown stream " << stream_id;
            return tl::make_unexpected(ErrorCode::STREAM_NOT_FOUND);
        }
        if (chunk_index < 0 || chunk_index >= it->second.num_chunks) {
            LOG(WARNING) << "Invalid chunk index " << chunk_index
                         << " for stream " << stream_id << " with "
                         << it->second.num_chunks << " chunks";
            return tl::make_unexpected(ErrorCode::INVALID_CHUNK_INDEX);
        }
        resolver = it->second.resolver;
    }

    // The resolver may touch the disk; run it outside the lock.
    auto buffer = resolver(chunk_index, offset, len);
    if (!buffer) {
        LOG(WARNING) << "Failed to resolve chunk " << chunk_index
                     << " of stream " << stream_id << ": " << buffer.error();
    }
    return buffer;
}

size_t ChunkStreamManager::numStreams() const {
    SharedMutexLocker lock(&mutex_, shared_lock);
    return streams_.size();
}

}  // namespace shufflenet
