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

#ifndef PROTOCOL_H_
#define PROTOCOL_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "managed_buffer.h"
#include "types.h"

namespace shufflenet {

// Wire format, all integers little-endian:
//
//   frame   := body_length:u32 type:u8 body
//   slice   := stream_id:i64 chunk_index:i32 offset:i32 len:i32
//   request := slice
//   success := slice payload_length:i32 payload
//   failure := slice message_length:i32 message
//
// body_length counts the bytes after the 5-byte header, so a receiver knows
// the kind and the full size of a frame before reading its body.

enum class MessageType : uint8_t {
    kChunkFetchRequest = 0,
    kChunkFetchSuccess = 1,
    kChunkFetchFailure = 2,
};

const char *messageTypeName(MessageType type);

/**
 * @brief Identifies one requested unit: a chunk of a stream, optionally
 * narrowed to [offset, offset + len) within the chunk
 */
struct StreamChunkSlice {
    StreamId stream_id = 0;
    int32_t chunk_index = 0;
    int32_t offset = 0;
    int32_t len = kUnboundedLength;

    static constexpr size_t kEncodedLength = 20;

    bool operator==(const StreamChunkSlice &other) const = default;

    std::string toString() const;
};

struct ChunkFetchRequest {
    StreamChunkSlice slice;
};

struct ChunkFetchSuccess {
    StreamChunkSlice slice;
    ManagedBuffer body;
};

struct ChunkFetchFailure {
    StreamChunkSlice slice;
    std::string error_string;
};

using Message =
    std::variant<ChunkFetchRequest, ChunkFetchSuccess, ChunkFetchFailure>;

struct FrameHeader {
    MessageType type;
    uint32_t body_length;
};

static constexpr size_t kFrameHeaderLength = 5;
static constexpr size_t kSuccessFixedLength =
    StreamChunkSlice::kEncodedLength + sizeof(int32_t);

std::string encodeFrame(const ChunkFetchRequest &request);

std::string encodeFrame(const ChunkFetchFailure &failure);

// Materializes the payload with ManagedBuffer::asBytes().
tl::expected<std::string, ErrorCode> encodeFrame(
    const ChunkFetchSuccess &success);

// Frame header and the fixed part of a success body. The payload_size bytes
// of payload follow on the wire.
tl::expected<std::string, ErrorCode> encodeSuccessHeader(
    const StreamChunkSlice &slice, size_t payload_size);

/**
 * @brief Parses the 5-byte frame header
 * @return MALFORMED_FRAME if fewer than 5 bytes are given,
 * UNKNOWN_MESSAGE_TYPE, or FRAME_TOO_LARGE if the body exceeds max_frame_size
 */
tl::expected<FrameHeader, ErrorCode> decodeFrameHeader(std::string_view data,
                                                       size_t max_frame_size);

/**
 * @brief Decodes a complete frame body
 * @return the message, or MALFORMED_FRAME if the body is truncated, carries
 * trailing bytes or negative lengths. A success payload becomes an in-memory
 * ManagedBuffer with reference count 1.
 */
tl::expected<Message, ErrorCode> decodeFrameBody(const FrameHeader &header,
                                                 std::string body);

}  // namespace shufflenet

#endif  // PROTOCOL_H_
