#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "managed_buffer.h"
#include "mutex.h"
#include "types.h"

namespace shufflenet {

/**
 * @brief Produces the buffer for one chunk of a stream
 *
 * Called with the chunk index and the requested range hint (offset into the
 * chunk, and maximum length or kUnboundedLength). Returns a new buffer with
 * reference count 1 owned by the caller, or an error such as
 * INVALID_CHUNK_INDEX.
 */
using ChunkResolver = std::function<tl::expected<ManagedBuffer, ErrorCode>(
    int32_t chunk_index, int32_t offset, int32_t len)>;

/**
 * @brief Resolver over consecutive segments of one file
 *
 * Chunk i covers [offsets[i], offsets[i + 1]) of the file. The range hint
 * narrows the chunk: the segment starts offset bytes into the chunk (capped
 * at the chunk end) and is at most len bytes long.
 */
class FileChunkResolver {
   public:
    FileChunkResolver(std::string path, std::vector<uint64_t> chunk_offsets);

    tl::expected<ManagedBuffer, ErrorCode> operator()(int32_t chunk_index,
                                                      int32_t offset,
                                                      int32_t len) const;

    int32_t numChunks() const {
        return chunk_offsets_.empty()
                   ? 0
                   : static_cast<int32_t>(chunk_offsets_.size() - 1);
    }

   private:
    std::string path_;
    std::vector<uint64_t> chunk_offsets_;
};

/**
 * @brief Registry of chunk streams served by this node
 *
 * Maps a stream id to a resolver and the declared number of chunks. Lookups
 * are pass-through: no caching and no retry.
 */
class ChunkStreamManager {
   public:
    ChunkStreamManager();

    /**
     * @brief Registers a stream under a caller-chosen id
     * @return OK, STREAM_ALREADY_EXISTS or INVALID_PARAMS
     */
    ErrorCode registerStream(StreamId stream_id, int32_t num_chunks,
                             ChunkResolver resolver);

    /**
     * @brief Registers a stream under a freshly allocated id
     * @return the new stream id, or INVALID_PARAMS
     */
    tl::expected<StreamId, ErrorCode> registerStream(int32_t num_chunks,
                                                     ChunkResolver resolver);

    ErrorCode unregisterStream(StreamId stream_id);

    /**
     * @brief Resolves one chunk
     * @return a buffer with reference count 1 owned by the caller, or
     * STREAM_NOT_FOUND / INVALID_CHUNK_INDEX / the resolver's error
     */
    tl::expected<ManagedBuffer, ErrorCode> getChunk(StreamId stream_id,
                                                    int32_t chunk_index,
                                                    int32_t offset,
                                                    int32_t len);

    size_t numStreams() const;

   private:
    struct StreamState {
        int32_t num_chunks;
        ChunkResolver resolver;
    };

    mutable SharedMutex mutex_;
    std::unordered_map<StreamId, StreamState> streams_ GUARDED_BY(mutex_);
    std::atomic<StreamId> next_stream_id_;
};

}  // namespace shufflenet
